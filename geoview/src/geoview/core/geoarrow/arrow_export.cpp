#include "geoview/core/geoarrow/arrow_export.hpp"

#include "duckdb/common/arrow/schema_metadata.hpp"

namespace geoview {

namespace core {

static constexpr int64_t ARROW_FLAG_NULLABLE = 2;

// Stands in for the data buffer of empty columns, which must not be null
static const uint64_t EMPTY_BUFFER[1] = {0};

//------------------------------------------------------------------------------
// Schema
//------------------------------------------------------------------------------
namespace {

struct SchemaNode {
	ArrowSchema schema;
	string name;
	string format;
	unsafe_unique_array<char> metadata;
	vector<unique_ptr<SchemaNode>> children;
	vector<ArrowSchema *> child_pointers;
};

} // namespace

static void ReleaseChildSchema(ArrowSchema *schema) {
	if (!schema || !schema->release) {
		return;
	}
	schema->release = nullptr;
}

static void ReleaseRootSchema(ArrowSchema *schema) {
	if (!schema || !schema->release) {
		return;
	}
	schema->release = nullptr;
	delete static_cast<SchemaNode *>(schema->private_data);
	schema->private_data = nullptr;
}

// Points the C struct at the strings and children owned by the node
static void InitializeSchema(SchemaNode &node, ArrowSchema &schema, int64_t flags) {
	node.child_pointers.clear();
	for (auto &child : node.children) {
		node.child_pointers.push_back(&child->schema);
	}
	schema.format = node.format.c_str();
	schema.name = node.name.c_str();
	schema.metadata = node.metadata ? node.metadata.get() : nullptr;
	schema.flags = flags;
	schema.n_children = static_cast<int64_t>(node.children.size());
	schema.children = node.child_pointers.empty() ? nullptr : node.child_pointers.data();
	schema.dictionary = nullptr;
	schema.release = ReleaseChildSchema;
	schema.private_data = nullptr;
}

static unique_ptr<SchemaNode> CreateSchemaNode(string name, string format) {
	auto node = make_uniq<SchemaNode>();
	node->name = std::move(name);
	node->format = std::move(format);
	return node;
}

static unique_ptr<SchemaNode> CreateGeometrySchema(const GeoArrowField &field, GeometryType type) {
	auto root = CreateSchemaNode(field.name, field.format);

	ArrowSchemaMetadata metadata;
	for (auto &entry : field.metadata) {
		metadata.AddOption(entry.first, entry.second);
	}
	root->metadata = metadata.SerializeMetadata();

	// One nested child per List level, then the coordinate FixedSizeList and its Float64 values
	auto level_names = GeometryColumn::GetLevelNames(type);
	const auto depth = GeometryTypes::GetNestingDepth(type);
	auto current = root.get();
	for (idx_t level = 0; level < level_names.size(); level++) {
		string format;
		if (level + 1 == level_names.size()) {
			format = "g";
		} else if (level + 1 == depth) {
			format = "+w:2";
		} else {
			format = "+l";
		}
		current->children.push_back(CreateSchemaNode(level_names[level], format));
		current = current->children.back().get();
	}

	// Wire the C structs bottom-up, node addresses are stable from here on
	vector<SchemaNode *> chain;
	for (auto node = root.get(); node; node = node->children.empty() ? nullptr : node->children[0].get()) {
		chain.push_back(node);
	}
	for (idx_t i = chain.size(); i > 1; i--) {
		InitializeSchema(*chain[i - 1], chain[i - 1]->schema, 0);
	}
	return root;
}

void ArrowExport::ToArrowSchema(const GeoArrowTable &table, ArrowSchema *out) {
	if (!out) {
		throw InvalidInputException("ArrowExport::ToArrowSchema: output schema is null");
	}

	auto root = CreateSchemaNode(string(), "+s");
	auto &fields = table.Schema();
	for (idx_t i = 0; i < fields.size(); i++) {
		auto &field = fields[i];
		if (i == 0) {
			auto geometry = CreateGeometrySchema(field, table.GetGeometry().type);
			InitializeSchema(*geometry, geometry->schema, field.nullable ? ARROW_FLAG_NULLABLE : 0);
			root->children.push_back(std::move(geometry));
		} else {
			auto attribute = CreateSchemaNode(field.name, field.format);
			InitializeSchema(*attribute, attribute->schema, field.nullable ? ARROW_FLAG_NULLABLE : 0);
			root->children.push_back(std::move(attribute));
		}
	}

	InitializeSchema(*root, *out, 0);
	out->release = ReleaseRootSchema;
	out->private_data = root.release();
}

//------------------------------------------------------------------------------
// Array
//------------------------------------------------------------------------------
namespace {

struct ArrayNode {
	ArrowArray array;
	const void *buffers[3];
	vector<unique_ptr<ArrayNode>> children;
	vector<ArrowArray *> child_pointers;
};

struct ArrayRoot {
	shared_ptr<const GeoArrowTable> table;
	ArrayNode node;
};

} // namespace

static void ReleaseChildArray(ArrowArray *array) {
	if (!array || !array->release) {
		return;
	}
	array->release = nullptr;
}

static void ReleaseRootArray(ArrowArray *array) {
	if (!array || !array->release) {
		return;
	}
	array->release = nullptr;
	delete static_cast<ArrayRoot *>(array->private_data);
	array->private_data = nullptr;
}

template <class T>
static const void *BufferOrEmpty(const vector<T> &buffer) {
	return buffer.empty() ? static_cast<const void *>(EMPTY_BUFFER) : static_cast<const void *>(buffer.data());
}

static void InitializeArray(ArrayNode &node, ArrowArray &array, idx_t length, int64_t n_buffers) {
	node.child_pointers.clear();
	for (auto &child : node.children) {
		node.child_pointers.push_back(&child->array);
	}
	array.length = static_cast<int64_t>(length);
	array.null_count = 0;
	array.offset = 0;
	array.n_buffers = n_buffers;
	array.n_children = static_cast<int64_t>(node.children.size());
	array.buffers = node.buffers;
	array.children = node.child_pointers.empty() ? nullptr : node.child_pointers.data();
	array.dictionary = nullptr;
	array.release = ReleaseChildArray;
	array.private_data = nullptr;
}

// Creates the array of List level `level` (or the coordinate level once past the offsets)
static unique_ptr<ArrayNode> CreateGeometryLevel(const GeometryColumn &column, idx_t level, idx_t length) {
	auto node = make_uniq<ArrayNode>();
	node->buffers[0] = nullptr;

	if (level < column.offsets.size()) {
		auto &offsets = column.offsets[level];
		D_ASSERT(offsets.size() == length + 1);
		node->buffers[1] = offsets.data();
		const auto child_length = static_cast<idx_t>(offsets.back());
		node->children.push_back(CreateGeometryLevel(column, level + 1, child_length));
		InitializeArray(*node, node->array, length, 2);
		return node;
	}

	// Coordinates: FixedSizeList(2) over the interleaved Float64 values
	D_ASSERT(length == column.CoordinateCount());
	auto values = make_uniq<ArrayNode>();
	values->buffers[0] = nullptr;
	values->buffers[1] = BufferOrEmpty(column.coordinates);
	InitializeArray(*values, values->array, column.coordinates.size(), 2);
	node->children.push_back(std::move(values));
	InitializeArray(*node, node->array, length, 1);
	return node;
}

static unique_ptr<ArrayNode> CreateAttributeArray(const AttributeColumn &column) {
	auto node = make_uniq<ArrayNode>();
	node->buffers[0] = nullptr;
	if (column.type == AttributeType::FLOAT64) {
		node->buffers[1] = BufferOrEmpty(column.numeric_data);
		InitializeArray(*node, node->array, column.length, 2);
	} else {
		node->buffers[1] = column.string_offsets.data();
		node->buffers[2] = BufferOrEmpty(column.string_data);
		InitializeArray(*node, node->array, column.length, 3);
	}
	return node;
}

void ArrowExport::ToArrowArray(const shared_ptr<const GeoArrowTable> &table, ArrowArray *out) {
	if (!out) {
		throw InvalidInputException("ArrowExport::ToArrowArray: output array is null");
	}
	if (!table) {
		throw InvalidInputException("ArrowExport::ToArrowArray: table is null");
	}

	auto root = make_uniq<ArrayRoot>();
	root->table = table;
	auto &node = root->node;
	node.buffers[0] = nullptr;

	auto &geometry = table->GetGeometry();
	node.children.push_back(CreateGeometryLevel(geometry, 0, geometry.length));
	for (auto &attribute : table->GetAttributes()) {
		node.children.push_back(CreateAttributeArray(attribute));
	}

	InitializeArray(node, *out, table->RowCount(), 1);
	out->release = ReleaseRootArray;
	out->private_data = root.release();
}

} // namespace core

} // namespace geoview
