#include "basalt/metadata_io.h"

#include <cmath>
#include <limits>
#include <arrow/util/decimal.h>
#include <arrow/util/string.h>
#include <nlohmann/json.hpp>
#include <simdjson.h>

#include "basalt/locations.h"
#include "basalt/logging.h"

namespace basalt {

BASALT_LOG_TAG(MetadataIO);

namespace {

using nlohmann::json;
namespace od = simdjson::ondemand;

//==============================================================================
// Shared helpers
//==============================================================================

const char* TimeUnitName(arrow::TimeUnit::type unit) {
    switch (unit) {
        case arrow::TimeUnit::SECOND: return "s";
        case arrow::TimeUnit::MILLI: return "ms";
        case arrow::TimeUnit::MICRO: return "us";
        case arrow::TimeUnit::NANO: return "ns";
    }
    return "?";
}

Status ParseTimeUnit(std::string_view name, arrow::TimeUnit::type* unit) {
    if (name == "s") {
        *unit = arrow::TimeUnit::SECOND;
    } else if (name == "ms") {
        *unit = arrow::TimeUnit::MILLI;
    } else if (name == "us") {
        *unit = arrow::TimeUnit::MICRO;
    } else if (name == "ns") {
        *unit = arrow::TimeUnit::NANO;
    } else {
        return Status::Corruption("unknown time unit '" + std::string(name) + "'");
    }
    return Status::OK();
}

Status HexDecode(std::string_view hex, std::string* bytes) {
    if (hex.size() % 2 != 0) {
        return Status::Corruption("odd-length hex string");
    }
    bytes->assign(hex.size() / 2, '\0');
    for (size_t i = 0; i < bytes->size(); ++i) {
        uint8_t byte = 0;
        if (!arrow::ParseHexValue(hex.data() + 2 * i, &byte).ok()) {
            return Status::Corruption("invalid hex digit in '" + std::string(hex) + "'");
        }
        (*bytes)[i] = static_cast<char>(byte);
    }
    return Status::OK();
}

std::string_view BinaryView(const arrow::Scalar& scalar) {
    const auto& binary = static_cast<const arrow::BaseBinaryScalar&>(scalar);
    if (!binary.value) return std::string_view();
    return std::string_view(reinterpret_cast<const char*>(binary.value->data()),
                            static_cast<size_t>(binary.value->size()));
}

//==============================================================================
// Writing (nlohmann::json)
//==============================================================================

Status TypeToJson(const arrow::DataType& type, json* out) {
    json j;
    switch (type.id()) {
        case arrow::Type::BOOL: j["id"] = "bool"; break;
        case arrow::Type::INT8: j["id"] = "int8"; break;
        case arrow::Type::INT16: j["id"] = "int16"; break;
        case arrow::Type::INT32: j["id"] = "int32"; break;
        case arrow::Type::INT64: j["id"] = "int64"; break;
        case arrow::Type::UINT8: j["id"] = "uint8"; break;
        case arrow::Type::UINT16: j["id"] = "uint16"; break;
        case arrow::Type::UINT32: j["id"] = "uint32"; break;
        case arrow::Type::UINT64: j["id"] = "uint64"; break;
        case arrow::Type::FLOAT: j["id"] = "float"; break;
        case arrow::Type::DOUBLE: j["id"] = "double"; break;
        case arrow::Type::STRING: j["id"] = "utf8"; break;
        case arrow::Type::LARGE_STRING: j["id"] = "large_utf8"; break;
        case arrow::Type::BINARY: j["id"] = "binary"; break;
        case arrow::Type::LARGE_BINARY: j["id"] = "large_binary"; break;
        case arrow::Type::DATE32: j["id"] = "date32"; break;
        case arrow::Type::DATE64: j["id"] = "date64"; break;
        case arrow::Type::TIMESTAMP: {
            const auto& ts = static_cast<const arrow::TimestampType&>(type);
            j["id"] = "timestamp";
            j["unit"] = TimeUnitName(ts.unit());
            j["timezone"] = ts.timezone();
            break;
        }
        case arrow::Type::DECIMAL128: {
            const auto& dec = static_cast<const arrow::Decimal128Type&>(type);
            j["id"] = "decimal128";
            j["precision"] = dec.precision();
            j["scale"] = dec.scale();
            break;
        }
        default:
            return Status::UnsupportedType("cannot serialize type " + type.ToString());
    }
    *out = std::move(j);
    return Status::OK();
}

Status ScalarToJson(const arrow::Scalar& scalar, json* out) {
    switch (scalar.type->id()) {
        case arrow::Type::BOOL:
            *out = static_cast<const arrow::BooleanScalar&>(scalar).value;
            break;
        case arrow::Type::INT8:
            *out = static_cast<int64_t>(static_cast<const arrow::Int8Scalar&>(scalar).value);
            break;
        case arrow::Type::INT16:
            *out = static_cast<int64_t>(static_cast<const arrow::Int16Scalar&>(scalar).value);
            break;
        case arrow::Type::INT32:
            *out = static_cast<int64_t>(static_cast<const arrow::Int32Scalar&>(scalar).value);
            break;
        case arrow::Type::INT64:
            *out = static_cast<const arrow::Int64Scalar&>(scalar).value;
            break;
        case arrow::Type::UINT8:
            *out = static_cast<uint64_t>(static_cast<const arrow::UInt8Scalar&>(scalar).value);
            break;
        case arrow::Type::UINT16:
            *out = static_cast<uint64_t>(static_cast<const arrow::UInt16Scalar&>(scalar).value);
            break;
        case arrow::Type::UINT32:
            *out = static_cast<uint64_t>(static_cast<const arrow::UInt32Scalar&>(scalar).value);
            break;
        case arrow::Type::UINT64:
            *out = static_cast<const arrow::UInt64Scalar&>(scalar).value;
            break;
        case arrow::Type::FLOAT:
        case arrow::Type::DOUBLE: {
            double v = scalar.type->id() == arrow::Type::FLOAT
                ? static_cast<double>(static_cast<const arrow::FloatScalar&>(scalar).value)
                : static_cast<const arrow::DoubleScalar&>(scalar).value;
            // JSON has no infinities
            if (std::isinf(v)) {
                *out = v > 0 ? "inf" : "-inf";
            } else if (std::isnan(v)) {
                return Status::InvalidArgument("NaN is not a valid statistics bound");
            } else {
                *out = v;
            }
            break;
        }
        case arrow::Type::DATE32:
            *out = static_cast<int64_t>(static_cast<const arrow::Date32Scalar&>(scalar).value);
            break;
        case arrow::Type::DATE64:
            *out = static_cast<const arrow::Date64Scalar&>(scalar).value;
            break;
        case arrow::Type::TIMESTAMP:
            *out = static_cast<const arrow::TimestampScalar&>(scalar).value;
            break;
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
            *out = std::string(BinaryView(scalar));
            break;
        case arrow::Type::BINARY:
        case arrow::Type::LARGE_BINARY: {
            auto bytes = BinaryView(scalar);
            *out = arrow::HexEncode(reinterpret_cast<const uint8_t*>(bytes.data()),
                                    bytes.size());
            break;
        }
        case arrow::Type::DECIMAL128: {
            const auto& dec_type = static_cast<const arrow::Decimal128Type&>(*scalar.type);
            *out = static_cast<const arrow::Decimal128Scalar&>(scalar).value.ToString(
                dec_type.scale());
            break;
        }
        default:
            return Status::UnsupportedType("cannot serialize scalar of type " +
                                           scalar.type->ToString());
    }
    return Status::OK();
}

Status BoundToJson(const std::shared_ptr<arrow::Scalar>& bound, json* out) {
    if (!bound || !bound->is_valid) {
        *out = nullptr;
        return Status::OK();
    }
    return ScalarToJson(*bound, out);
}

Status BlockStatsToJson(const BlockStatistics& stats, json* out) {
    json columns = json::array();
    for (const auto& [id, column] : stats) {
        if (!column.type) {
            return Status::InvalidArgument("column " + std::to_string(id) + " has no type");
        }
        json c;
        c["column_id"] = id;
        BASALT_RETURN_NOT_OK(TypeToJson(*column.type, &c["type"]));
        BASALT_RETURN_NOT_OK(BoundToJson(column.min, &c["min"]));
        BASALT_RETURN_NOT_OK(BoundToJson(column.max, &c["max"]));
        c["null_count"] = column.null_count;
        c["row_count"] = column.row_count;
        columns.push_back(std::move(c));
    }
    *out = std::move(columns);
    return Status::OK();
}

Status StatsToJson(const Stats& stats, json* out) {
    json j;
    j["row_count"] = stats.row_count;
    j["block_count"] = stats.block_count;
    j["uncompressed_byte_size"] = stats.uncompressed_byte_size;
    j["compressed_byte_size"] = stats.compressed_byte_size;
    BASALT_RETURN_NOT_OK(BlockStatsToJson(stats.col_stats, &j["col_stats"]));
    *out = std::move(j);
    return Status::OK();
}

Status BlockMetaToJson(const BlockMeta& block, json* out) {
    json j;
    j["location"] = {{"path", block.location.path},
                     {"meta_size", block.location.meta_size}};
    j["row_count"] = block.row_count;
    j["block_size"] = block.block_size;
    BASALT_RETURN_NOT_OK(BlockStatsToJson(block.col_stats, &j["col_stats"]));
    *out = std::move(j);
    return Status::OK();
}

Status SchemaToJson(const arrow::Schema& schema, json* out) {
    json fields = json::array();
    for (const auto& field : schema.fields()) {
        json f;
        f["name"] = field->name();
        BASALT_RETURN_NOT_OK(TypeToJson(*field->type(), &f["type"]));
        f["nullable"] = field->nullable();
        fields.push_back(std::move(f));
    }
    *out = {{"fields", std::move(fields)}};
    return Status::OK();
}

Status Dump(const json& j, std::string* out) {
    try {
        *out = j.dump();
    } catch (const json::exception& e) {
        return Status::InvalidArgument(std::string("cannot encode metadata: ") + e.what());
    }
    return Status::OK();
}

//==============================================================================
// Reading (simdjson on-demand)
//==============================================================================

Status JsonError(const char* what, simdjson::error_code error) {
    return Status::Corruption(std::string(what) + ": " + simdjson::error_message(error));
}

template <typename T>
Status GetField(od::object& obj, const char* key, T* out) {
    auto error = obj[key].get(*out);
    if (error) return JsonError(key, error);
    return Status::OK();
}

Status GetString(od::object& obj, const char* key, std::string* out) {
    std::string_view view;
    BASALT_RETURN_NOT_OK(GetField(obj, key, &view));
    out->assign(view.data(), view.size());
    return Status::OK();
}

Status GetObject(od::object& obj, const char* key, od::object* out) {
    auto error = obj[key].get_object().get(*out);
    if (error) return JsonError(key, error);
    return Status::OK();
}

Status GetArray(od::object& obj, const char* key, od::array* out) {
    auto error = obj[key].get_array().get(*out);
    if (error) return JsonError(key, error);
    return Status::OK();
}

Status IsNull(od::value& value, bool* is_null) {
    od::json_type type;
    auto error = value.type().get(type);
    if (error) return JsonError("value type", error);
    *is_null = (type == od::json_type::null);
    return Status::OK();
}

Status ParseType(od::object& obj, std::shared_ptr<arrow::DataType>* type) {
    std::string id;
    BASALT_RETURN_NOT_OK(GetString(obj, "id", &id));

    if (id == "bool") { *type = arrow::boolean(); }
    else if (id == "int8") { *type = arrow::int8(); }
    else if (id == "int16") { *type = arrow::int16(); }
    else if (id == "int32") { *type = arrow::int32(); }
    else if (id == "int64") { *type = arrow::int64(); }
    else if (id == "uint8") { *type = arrow::uint8(); }
    else if (id == "uint16") { *type = arrow::uint16(); }
    else if (id == "uint32") { *type = arrow::uint32(); }
    else if (id == "uint64") { *type = arrow::uint64(); }
    else if (id == "float") { *type = arrow::float32(); }
    else if (id == "double") { *type = arrow::float64(); }
    else if (id == "utf8") { *type = arrow::utf8(); }
    else if (id == "large_utf8") { *type = arrow::large_utf8(); }
    else if (id == "binary") { *type = arrow::binary(); }
    else if (id == "large_binary") { *type = arrow::large_binary(); }
    else if (id == "date32") { *type = arrow::date32(); }
    else if (id == "date64") { *type = arrow::date64(); }
    else if (id == "timestamp") {
        std::string unit_name;
        std::string timezone;
        BASALT_RETURN_NOT_OK(GetString(obj, "unit", &unit_name));
        BASALT_RETURN_NOT_OK(GetString(obj, "timezone", &timezone));
        arrow::TimeUnit::type unit;
        BASALT_RETURN_NOT_OK(ParseTimeUnit(unit_name, &unit));
        *type = arrow::timestamp(unit, timezone);
    } else if (id == "decimal128") {
        int64_t precision = 0;
        int64_t scale = 0;
        BASALT_RETURN_NOT_OK(GetField(obj, "precision", &precision));
        BASALT_RETURN_NOT_OK(GetField(obj, "scale", &scale));
        if (precision < 1 || precision > 38 || scale > precision) {
            return Status::Corruption("invalid decimal128 precision/scale");
        }
        *type = arrow::decimal128(static_cast<int32_t>(precision),
                                  static_cast<int32_t>(scale));
    } else {
        return Status::Corruption("unknown type id '" + id + "'");
    }
    return Status::OK();
}

template <typename ScalarType, typename Raw>
Status MakeIntegral(Raw raw, const std::shared_ptr<arrow::DataType>& type,
                    std::shared_ptr<arrow::Scalar>* out) {
    using ValueType = typename ScalarType::ValueType;
    auto value = static_cast<ValueType>(raw);
    if (static_cast<Raw>(value) != raw) {
        return Status::Corruption("value " + std::to_string(raw) + " out of range for " +
                                  type->ToString());
    }
    *out = std::make_shared<ScalarType>(value, type);
    return Status::OK();
}

Status ParseFloating(od::value& value, double* out) {
    od::json_type type;
    auto error = value.type().get(type);
    if (error) return JsonError("floating bound", error);

    if (type == od::json_type::string) {
        std::string_view text;
        error = value.get_string().get(text);
        if (error) return JsonError("floating bound", error);
        if (text == "inf") {
            *out = std::numeric_limits<double>::infinity();
        } else if (text == "-inf") {
            *out = -std::numeric_limits<double>::infinity();
        } else {
            return Status::Corruption("invalid floating bound '" + std::string(text) + "'");
        }
        return Status::OK();
    }

    error = value.get_double().get(*out);
    if (error) return JsonError("floating bound", error);
    return Status::OK();
}

Status ParseScalar(od::value& value, const std::shared_ptr<arrow::DataType>& type,
                   std::shared_ptr<arrow::Scalar>* out) {
    simdjson::error_code error = simdjson::SUCCESS;
    int64_t i = 0;
    uint64_t u = 0;

    switch (type->id()) {
        case arrow::Type::BOOL: {
            bool b = false;
            error = value.get_bool().get(b);
            if (error) return JsonError("bool bound", error);
            *out = std::make_shared<arrow::BooleanScalar>(b);
            return Status::OK();
        }
        case arrow::Type::INT8:
        case arrow::Type::INT16:
        case arrow::Type::INT32:
        case arrow::Type::INT64:
        case arrow::Type::DATE32:
        case arrow::Type::DATE64:
        case arrow::Type::TIMESTAMP:
            error = value.get_int64().get(i);
            if (error) return JsonError("integer bound", error);
            break;
        case arrow::Type::UINT8:
        case arrow::Type::UINT16:
        case arrow::Type::UINT32:
        case arrow::Type::UINT64:
            error = value.get_uint64().get(u);
            if (error) return JsonError("unsigned bound", error);
            break;
        default:
            break;
    }

    switch (type->id()) {
        case arrow::Type::INT8: return MakeIntegral<arrow::Int8Scalar>(i, type, out);
        case arrow::Type::INT16: return MakeIntegral<arrow::Int16Scalar>(i, type, out);
        case arrow::Type::INT32: return MakeIntegral<arrow::Int32Scalar>(i, type, out);
        case arrow::Type::INT64: return MakeIntegral<arrow::Int64Scalar>(i, type, out);
        case arrow::Type::DATE32: return MakeIntegral<arrow::Date32Scalar>(i, type, out);
        case arrow::Type::DATE64: return MakeIntegral<arrow::Date64Scalar>(i, type, out);
        case arrow::Type::TIMESTAMP: return MakeIntegral<arrow::TimestampScalar>(i, type, out);
        case arrow::Type::UINT8: return MakeIntegral<arrow::UInt8Scalar>(u, type, out);
        case arrow::Type::UINT16: return MakeIntegral<arrow::UInt16Scalar>(u, type, out);
        case arrow::Type::UINT32: return MakeIntegral<arrow::UInt32Scalar>(u, type, out);
        case arrow::Type::UINT64: return MakeIntegral<arrow::UInt64Scalar>(u, type, out);
        case arrow::Type::FLOAT: {
            double d = 0;
            BASALT_RETURN_NOT_OK(ParseFloating(value, &d));
            *out = std::make_shared<arrow::FloatScalar>(static_cast<float>(d));
            return Status::OK();
        }
        case arrow::Type::DOUBLE: {
            double d = 0;
            BASALT_RETURN_NOT_OK(ParseFloating(value, &d));
            *out = std::make_shared<arrow::DoubleScalar>(d);
            return Status::OK();
        }
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
        case arrow::Type::BINARY:
        case arrow::Type::LARGE_BINARY:
        case arrow::Type::DECIMAL128:
            break;
        default:
            return Status::Corruption("statistics bound of unsupported type " +
                                      type->ToString());
    }

    std::string_view text;
    error = value.get_string().get(text);
    if (error) return JsonError("string bound", error);

    switch (type->id()) {
        case arrow::Type::STRING:
            *out = std::make_shared<arrow::StringScalar>(std::string(text));
            break;
        case arrow::Type::LARGE_STRING:
            *out = std::make_shared<arrow::LargeStringScalar>(std::string(text));
            break;
        case arrow::Type::BINARY:
        case arrow::Type::LARGE_BINARY: {
            std::string bytes;
            BASALT_RETURN_NOT_OK(HexDecode(text, &bytes));
            if (type->id() == arrow::Type::BINARY) {
                *out = std::make_shared<arrow::BinaryScalar>(std::move(bytes));
            } else {
                *out = std::make_shared<arrow::LargeBinaryScalar>(std::move(bytes));
            }
            break;
        }
        case arrow::Type::DECIMAL128: {
            const auto& dec_type = static_cast<const arrow::Decimal128Type&>(*type);
            arrow::Decimal128 decimal;
            int32_t precision = 0;
            int32_t scale = 0;
            auto status = arrow::Decimal128::FromString(text, &decimal, &precision, &scale);
            if (!status.ok()) {
                return Status::Corruption("decimal bound: " + status.message());
            }
            if (scale != dec_type.scale()) {
                auto rescaled = decimal.Rescale(scale, dec_type.scale());
                if (!rescaled.ok()) {
                    return Status::Corruption("decimal bound: " + rescaled.status().message());
                }
                decimal = *rescaled;
            }
            *out = std::make_shared<arrow::Decimal128Scalar>(decimal, type);
            break;
        }
        default:
            return Status::InternalError("unreachable bound type");
    }
    return Status::OK();
}

Status ParseBound(od::object& obj, const char* key,
                  const std::shared_ptr<arrow::DataType>& type,
                  std::shared_ptr<arrow::Scalar>* out) {
    od::value value;
    auto error = obj[key].get(value);
    if (error) return JsonError(key, error);

    bool is_null = false;
    BASALT_RETURN_NOT_OK(IsNull(value, &is_null));
    if (is_null) {
        *out = nullptr;
        return Status::OK();
    }
    auto status = ParseScalar(value, type, out);
    return status.WithContext(key);
}

Status ParseBlockStats(od::array& columns, BlockStatistics* stats) {
    stats->clear();
    for (auto element : columns) {
        od::object obj;
        auto error = element.get_object().get(obj);
        if (error) return JsonError("col_stats entry", error);

        uint64_t id = 0;
        BASALT_RETURN_NOT_OK(GetField(obj, "column_id", &id));
        if (id > std::numeric_limits<ColumnId>::max()) {
            return Status::Corruption("column id out of range");
        }

        ColumnStatistics column;
        od::object type_obj;
        BASALT_RETURN_NOT_OK(GetObject(obj, "type", &type_obj));
        BASALT_RETURN_NOT_OK(ParseType(type_obj, &column.type));
        BASALT_RETURN_NOT_OK(ParseBound(obj, "min", column.type, &column.min));
        BASALT_RETURN_NOT_OK(ParseBound(obj, "max", column.type, &column.max));
        BASALT_RETURN_NOT_OK(GetField(obj, "null_count", &column.null_count));
        BASALT_RETURN_NOT_OK(GetField(obj, "row_count", &column.row_count));

        if (column.null_count < 0 || column.null_count > column.row_count) {
            return Status::Corruption("column " + std::to_string(id) +
                                      " has null_count outside [0, row_count]");
        }
        if (!stats->emplace(static_cast<ColumnId>(id), std::move(column)).second) {
            return Status::Corruption("duplicate column id " + std::to_string(id));
        }
    }
    return Status::OK();
}

Status ParseStats(od::object& obj, Stats* stats) {
    BASALT_RETURN_NOT_OK(GetField(obj, "row_count", &stats->row_count));
    BASALT_RETURN_NOT_OK(GetField(obj, "block_count", &stats->block_count));
    BASALT_RETURN_NOT_OK(GetField(obj, "uncompressed_byte_size",
                                  &stats->uncompressed_byte_size));
    BASALT_RETURN_NOT_OK(GetField(obj, "compressed_byte_size",
                                  &stats->compressed_byte_size));
    od::array columns;
    BASALT_RETURN_NOT_OK(GetArray(obj, "col_stats", &columns));
    return ParseBlockStats(columns, &stats->col_stats);
}

Status ParseBlockMeta(od::object& obj, BlockMeta* block) {
    od::object location;
    BASALT_RETURN_NOT_OK(GetObject(obj, "location", &location));
    BASALT_RETURN_NOT_OK(GetString(location, "path", &block->location.path));
    BASALT_RETURN_NOT_OK(GetField(location, "meta_size", &block->location.meta_size));

    BASALT_RETURN_NOT_OK(GetField(obj, "row_count", &block->row_count));
    BASALT_RETURN_NOT_OK(GetField(obj, "block_size", &block->block_size));

    od::array columns;
    BASALT_RETURN_NOT_OK(GetArray(obj, "col_stats", &columns));
    return ParseBlockStats(columns, &block->col_stats);
}

Status ParseSchema(od::object& obj, std::shared_ptr<arrow::Schema>* schema) {
    od::array fields;
    BASALT_RETURN_NOT_OK(GetArray(obj, "fields", &fields));

    arrow::FieldVector result;
    for (auto element : fields) {
        od::object field;
        auto error = element.get_object().get(field);
        if (error) return JsonError("schema field", error);

        std::string name;
        bool nullable = true;
        std::shared_ptr<arrow::DataType> type;
        BASALT_RETURN_NOT_OK(GetString(field, "name", &name));
        od::object type_obj;
        BASALT_RETURN_NOT_OK(GetObject(field, "type", &type_obj));
        BASALT_RETURN_NOT_OK(ParseType(type_obj, &type));
        BASALT_RETURN_NOT_OK(GetField(field, "nullable", &nullable));
        result.push_back(arrow::field(name, type, nullable));
    }
    *schema = arrow::schema(std::move(result));
    return Status::OK();
}

Status CheckFormatVersion(od::object& root) {
    uint64_t version = 0;
    BASALT_RETURN_NOT_OK(GetField(root, "format_version", &version));
    if (version != kMetadataFormatVersion) {
        return Status::Corruption("unsupported metadata format version " +
                                  std::to_string(version));
    }
    return Status::OK();
}

// Parses one JSON document and hands its root object to `body`.
template <typename Body>
Status ParseDocument(std::string_view text, const char* what, Body&& body) {
    try {
        thread_local od::parser parser;
        simdjson::padded_string padded(text);

        od::document doc;
        auto error = parser.iterate(padded).get(doc);
        if (error) return JsonError(what, error);

        od::object root;
        error = doc.get_object().get(root);
        if (error) return JsonError(what, error);

        return body(root).WithContext(what);
    } catch (const simdjson::simdjson_error& e) {
        return Status::Corruption(std::string(what) + ": " + e.what());
    } catch (const std::bad_alloc&) {
        return Status::InternalError(std::string(what) + ": out of memory");
    }
}

Status ToBuffer(const std::string& json_text, std::shared_ptr<arrow::Buffer>* buffer) {
    *buffer = arrow::Buffer::FromString(json_text);
    return Status::OK();
}

} // namespace

//==============================================================================
// Public codecs
//==============================================================================

Status SerializeBlockStatistics(const BlockStatistics& stats, std::string* out) {
    json j;
    BASALT_RETURN_NOT_OK(BlockStatsToJson(stats, &j));
    return Dump(j, out);
}

Status DeserializeBlockStatistics(std::string_view text, BlockStatistics* stats) {
    try {
        thread_local od::parser parser;
        simdjson::padded_string padded(text);

        od::document doc;
        auto error = parser.iterate(padded).get(doc);
        if (error) return JsonError("block statistics", error);

        od::array columns;
        error = doc.get_array().get(columns);
        if (error) return JsonError("block statistics", error);
        return ParseBlockStats(columns, stats);
    } catch (const simdjson::simdjson_error& e) {
        return Status::Corruption(std::string("block statistics: ") + e.what());
    }
}

Status SerializeSegmentInfo(const SegmentInfo& segment, std::string* out) {
    json j;
    j["format_version"] = kMetadataFormatVersion;

    json blocks = json::array();
    for (const auto& block : segment.blocks) {
        json b;
        BASALT_RETURN_NOT_OK(BlockMetaToJson(*block, &b));
        blocks.push_back(std::move(b));
    }
    j["blocks"] = std::move(blocks);
    BASALT_RETURN_NOT_OK(StatsToJson(segment.summary, &j["summary"]));
    return Dump(j, out);
}

Status DeserializeSegmentInfo(std::string_view text, SegmentInfo* segment) {
    return ParseDocument(text, "segment", [segment](od::object& root) -> Status {
        BASALT_RETURN_NOT_OK(CheckFormatVersion(root));

        SegmentInfo result;
        od::array blocks;
        BASALT_RETURN_NOT_OK(GetArray(root, "blocks", &blocks));
        for (auto element : blocks) {
            od::object obj;
            auto error = element.get_object().get(obj);
            if (error) return JsonError("block", error);

            auto block = std::make_shared<BlockMeta>();
            BASALT_RETURN_NOT_OK(ParseBlockMeta(obj, block.get()));
            result.blocks.push_back(std::move(block));
        }

        od::object summary;
        BASALT_RETURN_NOT_OK(GetObject(root, "summary", &summary));
        BASALT_RETURN_NOT_OK(ParseStats(summary, &result.summary));

        if (result.summary.block_count != result.blocks.size()) {
            return Status::Corruption("summary block_count does not match block list");
        }

        *segment = std::move(result);
        return Status::OK();
    });
}

Status SerializeTableSnapshot(const TableSnapshot& snapshot, std::string* out) {
    if (!snapshot.schema) {
        return Status::InvalidArgument("snapshot has no schema");
    }

    json j;
    j["format_version"] = kMetadataFormatVersion;
    j["snapshot_id"] = snapshot.snapshot_id;
    if (snapshot.prev_snapshot_id) {
        j["prev_snapshot_id"] = *snapshot.prev_snapshot_id;
    } else {
        j["prev_snapshot_id"] = nullptr;
    }
    BASALT_RETURN_NOT_OK(SchemaToJson(*snapshot.schema, &j["schema"]));
    BASALT_RETURN_NOT_OK(StatsToJson(snapshot.summary, &j["summary"]));
    j["segments"] = snapshot.segments;
    return Dump(j, out);
}

Status DeserializeTableSnapshot(std::string_view text, TableSnapshot* snapshot) {
    return ParseDocument(text, "snapshot", [snapshot](od::object& root) -> Status {
        BASALT_RETURN_NOT_OK(CheckFormatVersion(root));

        TableSnapshot result;
        BASALT_RETURN_NOT_OK(GetString(root, "snapshot_id", &result.snapshot_id));

        od::value prev;
        auto error = root["prev_snapshot_id"].get(prev);
        if (error) return JsonError("prev_snapshot_id", error);
        bool prev_is_null = false;
        BASALT_RETURN_NOT_OK(IsNull(prev, &prev_is_null));
        if (!prev_is_null) {
            std::string_view prev_id;
            error = prev.get_string().get(prev_id);
            if (error) return JsonError("prev_snapshot_id", error);
            result.prev_snapshot_id = std::string(prev_id);
        }

        od::object schema;
        BASALT_RETURN_NOT_OK(GetObject(root, "schema", &schema));
        BASALT_RETURN_NOT_OK(ParseSchema(schema, &result.schema));

        od::object summary;
        BASALT_RETURN_NOT_OK(GetObject(root, "summary", &summary));
        BASALT_RETURN_NOT_OK(ParseStats(summary, &result.summary));

        od::array segments;
        BASALT_RETURN_NOT_OK(GetArray(root, "segments", &segments));
        for (auto element : segments) {
            std::string_view location;
            error = element.get_string().get(location);
            if (error) return JsonError("segment location", error);
            result.segments.emplace_back(location);
        }

        *snapshot = std::move(result);
        return Status::OK();
    });
}

//==============================================================================
// Readers and writers
//==============================================================================

Status SnapshotReader::Read(DataAccessor* accessor,
                            const std::string& location,
                            SnapshotCache* cache,
                            TableSnapshotPtr* snapshot) {
    if (cache) {
        if (auto cached = cache->Get(location)) {
            *snapshot = std::move(cached);
            return Status::OK();
        }
    }

    std::shared_ptr<arrow::Buffer> data;
    auto status = accessor->Read(location, &data);
    if (!status.ok()) {
        return status.WithContext("snapshot " + location)
            .WithStage(OperationStage::kResolveSnapshot);
    }

    auto result = std::make_shared<TableSnapshot>();
    status = DeserializeTableSnapshot(
        std::string_view(reinterpret_cast<const char*>(data->data()),
                         static_cast<size_t>(data->size())),
        result.get());
    if (!status.ok()) {
        BASALT_LOG_WARN(MetadataIO) << "malformed snapshot " << location << ": "
                                    << status.ToString();
        return status.WithContext(location).WithStage(OperationStage::kResolveSnapshot);
    }

    if (cache) {
        cache->Put(location, result);
    }
    *snapshot = std::move(result);
    return Status::OK();
}

Status SegmentReader::Read(DataAccessor* accessor,
                           const std::string& location,
                           SegmentCache* cache,
                           SegmentInfoPtr* segment) {
    if (cache) {
        if (auto cached = cache->Get(location)) {
            *segment = std::move(cached);
            return Status::OK();
        }
    }

    std::shared_ptr<arrow::Buffer> data;
    auto status = accessor->Read(location, &data);
    if (!status.ok()) {
        return status.WithContext("segment " + location)
            .WithStage(OperationStage::kResolveSegment);
    }

    auto result = std::make_shared<SegmentInfo>();
    status = DeserializeSegmentInfo(
        std::string_view(reinterpret_cast<const char*>(data->data()),
                         static_cast<size_t>(data->size())),
        result.get());
    if (!status.ok()) {
        BASALT_LOG_WARN(MetadataIO) << "malformed segment " << location << ": "
                                    << status.ToString();
        return status.WithContext(location).WithStage(OperationStage::kResolveSegment);
    }

    if (cache) {
        cache->Put(location, result);
    }
    *segment = std::move(result);
    return Status::OK();
}

Status WriteSegment(DataAccessor* accessor,
                    const std::string& location,
                    const SegmentInfo& segment) {
    std::string text;
    BASALT_RETURN_NOT_OK(SerializeSegmentInfo(segment, &text));

    std::shared_ptr<arrow::Buffer> buffer;
    BASALT_RETURN_NOT_OK(ToBuffer(text, &buffer));
    auto status = accessor->Put(location, buffer);
    return status.WithContext("segment " + location).WithStage(OperationStage::kWrite);
}

Status WriteSnapshot(DataAccessor* accessor, const TableSnapshot& snapshot) {
    std::string text;
    BASALT_RETURN_NOT_OK(SerializeTableSnapshot(snapshot, &text));

    std::shared_ptr<arrow::Buffer> buffer;
    BASALT_RETURN_NOT_OK(ToBuffer(text, &buffer));
    const std::string location = SnapshotLocation(snapshot.snapshot_id);
    auto status = accessor->Put(location, buffer);
    return status.WithContext("snapshot " + location).WithStage(OperationStage::kWrite);
}

} // namespace basalt
