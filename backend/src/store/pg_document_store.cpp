#include "store/pg_document_store.hpp"

#include "audit/logger.hpp"

#include <libpq-fe.h>

#include <cctype>
#include <unordered_set>

namespace candlecast::store {

namespace {

struct ResultGuard {
    PGresult* res = nullptr;
    explicit ResultGuard(PGresult* r) : res(r) {}
    ~ResultGuard() {
        if (res) PQclear(res);
    }
    ResultGuard(const ResultGuard&) = delete;
    ResultGuard& operator=(const ResultGuard&) = delete;
};

core::Error classify(PGconn* conn, PGresult* res) {
    std::string message = conn ? PQerrorMessage(conn) : "no connection";
    if (res) {
        if (const char* text = PQresultErrorMessage(res)) {
            if (text[0] != '\0') message = text;
        }
    }
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) message.pop_back();

    const char* sqlstate = res ? PQresultErrorField(res, PG_DIAG_SQLSTATE) : nullptr;
    if (sqlstate && sqlstate[0] == '5' && sqlstate[1] == '3') {
        return core::make_error(core::ErrorCode::Quota, "resource exhausted: " + message);
    }
    if (sqlstate && std::string(sqlstate) == "57014") {
        return core::make_error(core::ErrorCode::Timeout, message);
    }
    if (!conn || PQstatus(conn) != CONNECTION_OK || (sqlstate && sqlstate[0] == '0' && sqlstate[1] == '8')) {
        return core::make_error(core::ErrorCode::Unavailable, message);
    }
    return core::make_error(core::ErrorCode::Io, message);
}

PGresult* exec_params(PGconn* conn, const std::string& sql, const std::vector<std::string>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p.c_str());
    return PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                        values.empty() ? nullptr : values.data(), nullptr, nullptr, 0);
}

std::string text_array_literal(const std::vector<std::string>& items) {
    std::string out = "{";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        for (char c : items[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

const char* comparison(FilterOp op) {
    switch (op) {
        case FilterOp::Lt: return "<";
        case FilterOp::Le: return "<=";
        case FilterOp::Gt: return ">";
        case FilterOp::Ge: return ">=";
        default: return "=";
    }
}

} // namespace

PgDocumentStore::PgDocumentStore(std::string dsn, pg_conn* conn, size_t max_batch_ops)
    : dsn_(std::move(dsn)), conn_(conn), max_batch_ops_(max_batch_ops == 0 ? 1 : max_batch_ops) {}

PgDocumentStore::~PgDocumentStore() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

core::Expected<std::unique_ptr<PgDocumentStore>> PgDocumentStore::connect(const std::string& dsn,
                                                                         size_t max_batch_ops) {
    if (dsn.empty()) {
        return core::make_error(core::ErrorCode::Invalid, "document store DSN is empty (set CANDLECAST_PG_DSN)");
    }
    PGconn* conn = PQconnectdb(dsn.c_str());
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        core::Error error = core::make_error(core::ErrorCode::Unavailable,
                                             std::string("document store connection failed: ") +
                                                 (conn ? PQerrorMessage(conn) : "out of memory"));
        if (conn) PQfinish(conn);
        return error;
    }
    return std::unique_ptr<PgDocumentStore>(new PgDocumentStore(dsn, conn, max_batch_ops));
}

size_t PgDocumentStore::max_batch_ops() const {
    return max_batch_ops_;
}

std::string PgDocumentStore::table_name(const std::string& collection) {
    std::string out = "doc_";
    for (char c : collection) {
        unsigned char u = static_cast<unsigned char>(c);
        out += std::isalnum(u) ? static_cast<char>(std::tolower(u)) : '_';
    }
    return out;
}

core::Status PgDocumentStore::ensure_connected() {
    if (conn_ && PQstatus(conn_) == CONNECTION_OK) return core::Status::ok();
    if (conn_) {
        PQreset(conn_);
        if (PQstatus(conn_) == CONNECTION_OK) {
            known_tables_.clear();
            return core::Status::ok();
        }
        PQfinish(conn_);
        conn_ = nullptr;
    }
    conn_ = PQconnectdb(dsn_.c_str());
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        std::string message = conn_ ? PQerrorMessage(conn_) : "out of memory";
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        return core::make_error(core::ErrorCode::Unavailable, "document store reconnect failed: " + message);
    }
    known_tables_.clear();
    return core::Status::ok();
}

core::Status PgDocumentStore::exec(const std::string& sql) {
    ResultGuard res(PQexec(conn_, sql.c_str()));
    if (!res.res || PQresultStatus(res.res) != PGRES_COMMAND_OK) {
        return classify(conn_, res.res);
    }
    return core::Status::ok();
}

core::Status PgDocumentStore::ensure_table(const std::string& table) {
    core::Status status = ensure_connected();
    if (!status) return status;
    if (known_tables_.count(table)) return core::Status::ok();
    status = exec("CREATE TABLE IF NOT EXISTS " + table +
                  " (id TEXT PRIMARY KEY, body JSONB NOT NULL DEFAULT '{}'::jsonb)");
    if (!status) return status;
    known_tables_.insert(table);
    return core::Status::ok();
}

core::Status PgDocumentStore::commit(const std::string& collection, const std::vector<WriteOp>& ops) {
    if (ops.size() > max_batch_ops_) {
        return core::make_error(core::ErrorCode::Range, "batch of " + std::to_string(ops.size()) +
                                                            " exceeds limit " + std::to_string(max_batch_ops_));
    }
    if (ops.empty()) return core::Status::ok();

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string table = table_name(collection);
    core::Status status = ensure_table(table);
    if (!status) return status;

    status = exec("BEGIN");
    if (!status) return status;

    const std::string merge_sql = "INSERT INTO " + table + " (id, body) VALUES ($1, $2::jsonb) "
                                  "ON CONFLICT (id) DO UPDATE SET body = " + table + ".body || EXCLUDED.body";
    const std::string update_sql = "UPDATE " + table + " SET body = body || $2::jsonb WHERE id = $1";
    const std::string delete_sql = "DELETE FROM " + table + " WHERE id = $1";

    for (const auto& op : ops) {
        std::vector<std::string> params{op.id};
        const std::string* sql = &delete_sql;
        if (op.kind != WriteKind::Delete) {
            params.push_back(op.fields.dump());
            sql = (op.kind == WriteKind::Merge) ? &merge_sql : &update_sql;
        }
        ResultGuard res(exec_params(conn_, *sql, params));
        if (!res.res || PQresultStatus(res.res) != PGRES_COMMAND_OK) {
            core::Error error = classify(conn_, res.res);
            core::Status rollback = exec("ROLLBACK");
            if (!rollback) {
                audit::log_warn("Rollback on " + table + " failed: " + rollback.message());
            }
            return error;
        }
    }
    return exec("COMMIT");
}

core::Expected<std::optional<Json>> PgDocumentStore::get(const std::string& collection, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string table = table_name(collection);
    core::Status status = ensure_table(table);
    if (!status) return status.error_info();

    ResultGuard res(exec_params(conn_, "SELECT body::text FROM " + table + " WHERE id = $1", {id}));
    if (!res.res || PQresultStatus(res.res) != PGRES_TUPLES_OK) {
        return classify(conn_, res.res);
    }
    if (PQntuples(res.res) == 0) return std::optional<Json>{};
    Json body = Json::parse(PQgetvalue(res.res, 0, 0), nullptr, false);
    if (body.is_discarded()) {
        return core::make_error(core::ErrorCode::Parse, "unparseable document " + collection + "/" + id);
    }
    return std::optional<Json>(std::move(body));
}

core::Expected<std::vector<std::string>> PgDocumentStore::existing_ids(const std::string& collection,
                                                                       const std::vector<std::string>& ids) {
    std::vector<std::string> out;
    if (ids.empty()) return out;

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string table = table_name(collection);
    core::Status status = ensure_table(table);
    if (!status) return status.error_info();

    ResultGuard res(exec_params(conn_, "SELECT id FROM " + table + " WHERE id = ANY($1::text[])",
                                {text_array_literal(ids)}));
    if (!res.res || PQresultStatus(res.res) != PGRES_TUPLES_OK) {
        return classify(conn_, res.res);
    }
    std::unordered_set<std::string> found;
    for (int row = 0; row < PQntuples(res.res); ++row) {
        found.insert(PQgetvalue(res.res, row, 0));
    }
    for (const auto& id : ids) {
        if (found.count(id)) out.push_back(id);
    }
    return out;
}

core::Expected<std::vector<StoredDocument>> PgDocumentStore::scan(const std::string& collection,
                                                                  const Query& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string table = table_name(collection);
    core::Status status = ensure_table(table);
    if (!status) return status.error_info();

    std::vector<std::string> params;
    auto bind = [&](std::string value) {
        params.push_back(std::move(value));
        return "$" + std::to_string(params.size());
    };

    std::string sql = "SELECT id, body::text FROM " + table;
    std::string where;
    for (const auto& filter : query.filters) {
        std::string clause;
        const std::string field = bind(filter.field);
        switch (filter.op) {
            case FilterOp::Missing:
                clause = "COALESCE(jsonb_typeof(body->" + field + "), 'null') = 'null'";
                break;
            case FilterOp::Present:
                clause = "COALESCE(jsonb_typeof(body->" + field + "), 'null') <> 'null'";
                break;
            default:
                if (filter.value.is_number()) {
                    clause = "(CASE WHEN jsonb_typeof(body->" + field + ") = 'number' THEN (body->>" + field +
                             ")::double precision END) " + comparison(filter.op) + " " +
                             bind(filter.value.dump()) + "::double precision";
                } else if (filter.value.is_string()) {
                    clause = "(CASE WHEN jsonb_typeof(body->" + field + ") = 'string' THEN body->>" + field +
                             " END) COLLATE \"C\" " + comparison(filter.op) + " " +
                             bind(filter.value.get<std::string>());
                } else {
                    clause = "body->" + field + " = " + bind(filter.value.dump()) + "::jsonb";
                }
                break;
        }
        where += where.empty() ? " WHERE " : " AND ";
        where += clause;
    }
    sql += where;
    if (!query.order_by.empty()) {
        sql += " ORDER BY body->" + bind(query.order_by) + (query.descending ? " DESC" : " ASC") + ", id";
    }
    if (query.limit > 0) {
        sql += " LIMIT " + std::to_string(query.limit);
    }

    ResultGuard res(exec_params(conn_, sql, params));
    if (!res.res || PQresultStatus(res.res) != PGRES_TUPLES_OK) {
        return classify(conn_, res.res);
    }
    std::vector<StoredDocument> out;
    out.reserve(static_cast<size_t>(PQntuples(res.res)));
    for (int row = 0; row < PQntuples(res.res); ++row) {
        Json body = Json::parse(PQgetvalue(res.res, row, 1), nullptr, false);
        if (body.is_discarded()) {
            audit::log_warn("Skipping unparseable document " + collection + "/" + PQgetvalue(res.res, row, 0));
            continue;
        }
        out.push_back(StoredDocument{PQgetvalue(res.res, row, 0), std::move(body)});
    }
    return out;
}

} // namespace candlecast::store
