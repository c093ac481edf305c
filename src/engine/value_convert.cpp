//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/value_convert.cpp
//
// Value conversion implementation
//===----------------------------------------------------------------------===//

#include "engine/value_convert.hpp"
#include <stdexcept>

namespace dbdriver {

duckdb::Value ToDuckValue(const Value& value) {
    switch (value.GetType()) {
        case Value::Type::NULL_VALUE:
            return duckdb::Value();
        case Value::Type::BOOLEAN:
            return duckdb::Value::BOOLEAN(value.GetBool());
        case Value::Type::INTEGER:
            return duckdb::Value::BIGINT(value.GetInt());
        case Value::Type::DOUBLE:
            return duckdb::Value::DOUBLE(value.GetDouble());
        case Value::Type::STRING:
            return duckdb::Value(value.GetString());
        case Value::Type::BLOB: {
            const auto& bytes = value.GetBlob().bytes;
            return duckdb::Value::BLOB(bytes.data(), bytes.size());
        }
        case Value::Type::TIMESTAMP:
            return duckdb::Value::TIMESTAMP(duckdb::timestamp_t(value.GetTimestamp().micros));
        case Value::Type::LIST:
        case Value::Type::MAP:
            break;
    }
    throw std::invalid_argument(std::string(Value::TypeName(value.GetType())) +
                                " cannot be used as a column value");
}

duckdb::vector<duckdb::Value> ToDuckValues(const ValueList& values) {
    duckdb::vector<duckdb::Value> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        out.push_back(ToDuckValue(v));
    }
    return out;
}

Value FromDuckValue(const duckdb::Value& value) {
    if (value.IsNull()) {
        return Value();
    }

    const auto& type = value.type();
    switch (type.id()) {
        case duckdb::LogicalTypeId::BOOLEAN:
            return Value(value.GetValue<bool>());

        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
        case duckdb::LogicalTypeId::BIGINT:
        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::USMALLINT:
        case duckdb::LogicalTypeId::UINTEGER:
            return Value(value.GetValue<int64_t>());

        case duckdb::LogicalTypeId::UBIGINT:
        case duckdb::LogicalTypeId::HUGEINT: {
            // Out-of-range values keep their text form
            duckdb::Value as_bigint;
            std::string error;
            if (value.DefaultTryCastAs(duckdb::LogicalType::BIGINT, as_bigint, &error)) {
                return Value(as_bigint.GetValue<int64_t>());
            }
            return Value(value.ToString());
        }

        case duckdb::LogicalTypeId::FLOAT:
        case duckdb::LogicalTypeId::DOUBLE:
        case duckdb::LogicalTypeId::DECIMAL:
            return Value(value.GetValue<double>());

        case duckdb::LogicalTypeId::VARCHAR:
            return Value(duckdb::StringValue::Get(value));

        case duckdb::LogicalTypeId::BLOB: {
            const std::string& raw = duckdb::StringValue::Get(value);
            return Value(Blob(reinterpret_cast<const uint8_t*>(raw.data()), raw.size()));
        }

        case duckdb::LogicalTypeId::TIMESTAMP:
        case duckdb::LogicalTypeId::TIMESTAMP_TZ:
            return Value(Timestamp(value.GetValue<duckdb::timestamp_t>().value));

        case duckdb::LogicalTypeId::TIMESTAMP_SEC:
        case duckdb::LogicalTypeId::TIMESTAMP_MS:
        case duckdb::LogicalTypeId::TIMESTAMP_NS: {
            auto ts = value.DefaultCastAs(duckdb::LogicalType::TIMESTAMP);
            return Value(Timestamp(ts.GetValue<duckdb::timestamp_t>().value));
        }

        case duckdb::LogicalTypeId::LIST: {
            ValueList list;
            for (const auto& child : duckdb::ListValue::GetChildren(value)) {
                list.push_back(FromDuckValue(child));
            }
            return Value(std::move(list));
        }

        case duckdb::LogicalTypeId::STRUCT: {
            ValueMap map;
            const auto& children = duckdb::StructValue::GetChildren(value);
            for (duckdb::idx_t i = 0; i < children.size(); ++i) {
                map[duckdb::StructType::GetChildName(type, i)] = FromDuckValue(children[i]);
            }
            return Value(std::move(map));
        }

        default:
            // DATE, TIME, INTERVAL, UUID, ENUM ... travel as text
            return Value(value.ToString());
    }
}

ValueList ResultToRecords(duckdb::MaterializedQueryResult& result) {
    ValueList records;
    duckdb::idx_t rows = result.RowCount();
    duckdb::idx_t cols = result.ColumnCount();
    records.reserve(rows);

    for (duckdb::idx_t r = 0; r < rows; ++r) {
        ValueMap record;
        for (duckdb::idx_t c = 0; c < cols; ++c) {
            record[result.ColumnName(c)] = FromDuckValue(result.GetValue(c, r));
        }
        records.push_back(Value(std::move(record)));
    }
    return records;
}

} // namespace dbdriver
