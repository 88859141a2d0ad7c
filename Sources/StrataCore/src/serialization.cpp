#include "strata/serialization.hpp"
#include "strata/digest.hpp"
#include "strata/errors.hpp"

namespace strata {

namespace {

std::string default_kind_name(default_kind kind) {
    switch (kind) {
        case default_kind::none: return "none";
        case default_kind::literal: return "literal";
        case default_kind::keyword: return "keyword";
        case default_kind::expression: return "expression";
    }
    return "none";
}

default_kind default_kind_from_name(const std::string& name) {
    if (name == "literal") return default_kind::literal;
    if (name == "keyword") return default_kind::keyword;
    if (name == "expression") return default_kind::expression;
    return default_kind::none;
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    auto nibble = [](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw strata_error("Invalid hex digit in blob value");
    };
    if (hex.size() % 2 != 0) throw strata_error("Odd-length hex blob value");
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
    }
    return out;
}

} // namespace

void to_json(json& j, const column_info& c) {
    j = json{
        {"cid", c.ordinal},
        {"name", c.name},
        {"type", c.declared_type},
        {"notnull", c.not_null ? 1 : 0},
        {"dflt_value", c.default_val.kind == default_kind::none ? json(nullptr) : json(c.default_val.text)},
        {"dflt_kind", default_kind_name(c.default_val.kind)},
        {"pk", c.is_primary_key ? 1 : 0},
    };
}

void from_json(const json& j, column_info& c) {
    c.ordinal = j.value("cid", 0);
    c.name = j.at("name").get<std::string>();
    c.declared_type = j.value("type", std::string());
    c.not_null = j.value("notnull", 0) != 0;
    c.is_primary_key = j.value("pk", 0) != 0;
    const auto& dflt = j.contains("dflt_value") ? j.at("dflt_value") : json(nullptr);
    if (dflt.is_null()) {
        c.default_val = {};
    } else {
        c.default_val.text = dflt.is_string() ? dflt.get<std::string>() : dflt.dump();
        c.default_val.kind = default_kind_from_name(j.value("dflt_kind", std::string("literal")));
    }
}

void to_json(json& j, const foreign_key& fk) {
    j = json{
        {"from", fk.from},
        {"table", fk.table},
        {"to", fk.to},
        {"on_update", fk.on_update},
        {"on_delete", fk.on_delete},
    };
}

void from_json(const json& j, foreign_key& fk) {
    fk.from = j.at("from").get<std::string>();
    fk.table = j.at("table").get<std::string>();
    fk.to = j.contains("to") && j.at("to").is_string() ? j.at("to").get<std::string>() : std::string();
    fk.on_update = j.value("on_update", std::string("NO ACTION"));
    fk.on_delete = j.value("on_delete", std::string("NO ACTION"));
}

void to_json(json& j, const table_schema& s) {
    j = json{
        {"name", s.name},
        {"sql", s.create_sql},
        {"columns", s.columns},
        {"foreignKeys", s.foreign_keys},
        {"dependents", s.dependent_sql},
    };
}

void from_json(const json& j, table_schema& s) {
    s.name = j.at("name").get<std::string>();
    s.create_sql = j.at("sql").get<std::string>();
    s.columns = j.value("columns", std::vector<column_info>{});
    s.foreign_keys = j.value("foreignKeys", std::vector<foreign_key>{});
    s.dependent_sql = j.value("dependents", std::vector<std::string>{});
}

std::string schemas_to_json(const std::vector<table_schema>& schemas) {
    return json(schemas).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::vector<table_schema> schemas_from_json(const std::string& text) {
    try {
        auto j = json::parse(text);
        if (!j.is_array()) {
            throw strata_error("Snapshot tables_json is not an array");
        }
        return j.get<std::vector<table_schema>>();
    } catch (const json::exception& e) {
        throw strata_error(std::string("Failed to parse snapshot tables_json: ") + e.what());
    }
}

// Blobs are wrapped as {"$blob": "<hex>"} so they survive the text payload.
json column_value_to_json(const column_value_t& value) {
    return std::visit([](auto&& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            return json{{"$blob", to_hex(v.data(), v.size())}};
        } else {
            return v;
        }
    }, value);
}

column_value_t json_to_column_value(const json& j) {
    if (j.is_null()) return nullptr;
    if (j.is_string()) return j.get<std::string>();
    if (j.is_boolean()) return static_cast<int64_t>(j.get<bool>() ? 1 : 0);
    if (j.is_number_integer()) return j.get<int64_t>();
    if (j.is_number_float()) return j.get<double>();
    if (j.is_object() && j.contains("$blob")) return from_hex(j.at("$blob").get<std::string>());
    return j.dump();
}

std::string table_data_to_json(const table_data& data) {
    json root = json::object();
    for (const auto& [table, rows] : data) {
        json arr = json::array();
        for (const auto& row : rows) {
            json obj = json::object();
            for (const auto& [column, value] : row) {
                obj[column] = column_value_to_json(value);
            }
            arr.push_back(std::move(obj));
        }
        root[table] = std::move(arr);
    }
    return root.dump(-1, ' ', false, json::error_handler_t::replace);
}

table_data table_data_from_json(const std::string& text) {
    table_data data;
    try {
        auto root = json::parse(text);
        if (!root.is_object()) {
            throw strata_error("Snapshot data payload is not an object");
        }
        for (const auto& [table, rows] : root.items()) {
            auto& out = data[table];
            if (!rows.is_array()) continue;
            for (const auto& row : rows) {
                if (!row.is_object()) continue;
                std::vector<std::pair<std::string, column_value_t>> values;
                for (const auto& [column, value] : row.items()) {
                    values.emplace_back(column, json_to_column_value(value));
                }
                out.push_back(std::move(values));
            }
        }
    } catch (const json::exception& e) {
        throw strata_error(std::string("Failed to parse snapshot data payload: ") + e.what());
    }
    return data;
}

} // namespace strata
