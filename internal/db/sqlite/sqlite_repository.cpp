#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"

namespace valuegraph::db::sqlite {

using valuegraph::db::ErrorCode;
using valuegraph::db::Result;
using valuegraph::model::Value;
using valuegraph::model::ValueType;

namespace {

// sqlite3_bind_double turns NaN into NULL, so NaN is stored as this text in
// the REAL column. ±inf is a valid REAL and binds as a double.
constexpr const char* kNaNText = "NaN";

void CheckBind(int rc, sqlite3_stmt* st) {
    ThrowIf(rc, sqlite3_db_handle(st), "sqlite bind");
}

void BindReal(sqlite3_stmt* st, int idx, double v) {
    if (std::isnan(v)) {
        CheckBind(sqlite3_bind_text(st, idx, kNaNText, -1, SQLITE_STATIC), st);
    } else {
        CheckBind(sqlite3_bind_double(st, idx, v), st);
    }
}

double ColReal(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_TEXT) {
        const auto* t = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
        if (t && std::strcmp(t, kNaNText) == 0) return std::numeric_limits<double>::quiet_NaN();
    }
    return sqlite3_column_double(st, col);
}

void BindUuid(sqlite3_stmt* st, int idx, const util::UUID& id) {
    CheckBind(sqlite3_bind_blob(st, idx, id.data(), static_cast<int>(id.size()), SQLITE_TRANSIENT), st);
}

void BindOptionalUuid(sqlite3_stmt* st, int idx, const std::optional<util::UUID>& id) {
    if (id) {
        BindUuid(st, idx, *id);
    } else {
        CheckBind(sqlite3_bind_null(st, idx), st);
    }
}

// Sparse row: every payload column NULL except the active one.
void BindValue(sqlite3_stmt* st, int first_idx, const Value& value) {
    for (int i = 0; i < sql::kPayloadColumnCount; ++i) {
        CheckBind(sqlite3_bind_null(st, first_idx + i), st);
    }
    if (value.index() == 0) return;

    const int idx = first_idx + static_cast<int>(value.index()) - 1;
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return;
            } else if constexpr (std::is_same_v<T, std::string>) {
                CheckBind(sqlite3_bind_text(st, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT), st);
            } else if constexpr (std::is_floating_point_v<T>) {
                BindReal(st, idx, static_cast<double>(v));
            } else {
                // u64 above INT64_MAX is stored bit-cast and restored on read
                CheckBind(sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v)), st);
            }
        },
        value);
}

util::UUID ColUuid(sqlite3_stmt* st, int col) {
    // blob before bytes, per sqlite docs
    const void* blob = sqlite3_column_blob(st, col);
    return util::FromBytes(blob, static_cast<size_t>(sqlite3_column_bytes(st, col)));
}

Value ColScalar(sqlite3_stmt* st, int col, ValueType type) {
    const auto i64 = sqlite3_column_int64(st, col);
    switch (type) {
        case ValueType::kBool:
            return i64 != 0;
        case ValueType::kU8:
            return static_cast<uint8_t>(i64);
        case ValueType::kI8:
            return static_cast<int8_t>(i64);
        case ValueType::kU16:
            return static_cast<uint16_t>(i64);
        case ValueType::kI16:
            return static_cast<int16_t>(i64);
        case ValueType::kU32:
            return static_cast<uint32_t>(i64);
        case ValueType::kI32:
            return static_cast<int32_t>(i64);
        case ValueType::kU64:
            return static_cast<uint64_t>(i64);
        case ValueType::kI64:
            return static_cast<int64_t>(i64);
        case ValueType::kF32:
            return static_cast<float>(ColReal(st, col));
        case ValueType::kF64:
            return ColReal(st, col);
        case ValueType::kStr: {
            const auto* t = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
            return t ? std::string(t, static_cast<size_t>(sqlite3_column_bytes(st, col))) : std::string();
        }
        case ValueType::kNone:
        default:
            return std::monostate{};
    }
}

model::ValueRecord ColValueRecord(sqlite3_stmt* st) {
    model::ValueRecord r;
    r.id = ColUuid(st, 0);

    for (int i = 0; i < sql::kPayloadColumnCount; ++i) {
        const int col = 1 + i;
        if (sqlite3_column_type(st, col) == SQLITE_NULL) continue;

        if (r.value.index() != 0) {
            // legacy rows can violate the single-payload invariant; first column wins
            VALUEGRAPH_LOG_WARN("Value row has several payload columns set",
                                {observability::StringField("id", util::ToString(r.id)),
                                 observability::StringField("kept", valuegraph::model::ToString(valuegraph::model::TypeOf(r.value)))});
            break;
        }
        r.value = ColScalar(st, col, static_cast<ValueType>(i + 1));
    }
    return r;
}

model::LinkRecord ColLink(sqlite3_stmt* st) {
    model::LinkRecord r;
    r.handle = sqlite3_column_int64(st, 0);
    r.source = ColUuid(st, 1);
    if (sqlite3_column_type(st, 2) != SQLITE_NULL) {
        r.key = ColUuid(st, 2);
    }
    r.target = ColUuid(st, 3);
    return r;
}

class SqliteEdgeCursor final : public EdgeCursor {
public:
    explicit SqliteEdgeCursor(Statement st) : st_(std::move(st)) {}

    std::optional<model::LinkRecord> Next() override {
        if (done_) return std::nullopt;

        int rc = sqlite3_step(st_.get());
        if (rc == SQLITE_ROW) return ColLink(st_.get());

        done_ = true;
        if (rc != SQLITE_DONE) {
            ThrowIf(rc, sqlite3_db_handle(st_.get()), "sqlite edge cursor");
        }
        return std::nullopt;
    }

private:
    Statement st_;
    bool done_ = false;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {
    const auto generation = db_->UserVersion();
    if (generation != kLatestGeneration) {
        throw std::runtime_error("sqlite store " + db_->Path() + " is at generation " + std::to_string(generation) +
                                 ", expected " + std::to_string(kLatestGeneration) + "; run migrations first");
    }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, TxMode::kImmediate);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, TxMode::kDeferred);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            switch (sqlite3_extended_errcode(db)) {
                case SQLITE_CONSTRAINT_PRIMARYKEY:
                case SQLITE_CONSTRAINT_UNIQUE:
                    return Result::Err(ErrorCode::DuplicateIdentifier, sqlite3_errmsg(db));
                case SQLITE_CONSTRAINT_CHECK:
                    return Result::Err(ErrorCode::MalformedIdentifier, sqlite3_errmsg(db));
                default:
                    return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
            }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Generation SqliteRepository::SchemaGeneration(Transaction& t) {
    return TX(t).DB().UserVersion();
}

// ------------------------------------------------------------------
// Values
// ------------------------------------------------------------------

Result SqliteRepository::WriteValue(Transaction& t, const char* sql, const model::ValueRecord& r) {
    auto& db = TX(t).DB();
    auto st = db.Prepare(sql);

    BindUuid(st.get(), 1, r.id);
    BindValue(st.get(), 2, r.value);

    int rc = sqlite3_step(st.get());
    return Translate(db.Handle(), rc);
}

Result SqliteRepository::UpsertValue(Transaction& t, const model::ValueRecord& r) {
    return WriteValue(t, sql::UPSERT_VALUE, r);
}

Result SqliteRepository::InsertValue(Transaction& t, const model::ValueRecord& r) {
    return WriteValue(t, sql::INSERT_VALUE, r);
}

std::optional<model::ValueRecord>
SqliteRepository::GetValue(Transaction& t, const util::UUID& id) {
    auto& db = TX(t).DB();
    auto st = db.Prepare(sql::SELECT_VALUE);

    BindUuid(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowIf(rc, db.Handle(), "sqlite get value");

    return ColValueRecord(st.get());
}

Result SqliteRepository::DeleteValue(Transaction& t, const util::UUID& id) {
    auto& db = TX(t).DB();
    auto st = db.Prepare(sql::DELETE_VALUE);

    BindUuid(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db.Handle(), rc);
    if (sqlite3_changes(db.Handle()) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

std::vector<util::UUID>
SqliteRepository::FindValuesByString(Transaction& t, std::string_view text) {
    auto& db = TX(t).DB();
    auto st = db.Prepare(sql::SELECT_VALUES_BY_STR);

    CheckBind(sqlite3_bind_text(st.get(), 1, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT), st.get());

    std::vector<util::UUID> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ColUuid(st.get(), 0));
    }
    if (rc != SQLITE_DONE) ThrowIf(rc, db.Handle(), "sqlite find by string");

    return out;
}

uint64_t SqliteRepository::CountValues(Transaction& t) {
    return static_cast<uint64_t>(TX(t).DB().QueryInt64(sql::COUNT_VALUES));
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result SqliteRepository::InsertLink(Transaction& t, model::LinkRecord& r) {
    auto& db = TX(t).DB();
    auto st = db.Prepare(sql::INSERT_LINK);

    BindUuid(st.get(), 1, r.source);
    BindOptionalUuid(st.get(), 2, r.key);
    BindUuid(st.get(), 3, r.target);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db.Handle(), rc);

    r.handle = sqlite3_last_insert_rowid(db.Handle());
    return Result::Ok();
}

Result SqliteRepository::DeleteLink(Transaction& t, model::EdgeHandle handle) {
    auto& db = TX(t).DB();
    auto st = db.Prepare(sql::DELETE_LINK);

    CheckBind(sqlite3_bind_int64(st.get(), 1, handle), st.get());

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db.Handle(), rc);
    if (sqlite3_changes(db.Handle()) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

std::unique_ptr<EdgeCursor> SqliteRepository::OpenCursor(Transaction& t, const char* sql, model::EdgeHandle after,
                                                         const util::UUID& first, const util::UUID* second) {
    auto st = TX(t).DB().Prepare(sql);

    int idx = 1;
    BindUuid(st.get(), idx++, first);
    if (second) BindUuid(st.get(), idx++, *second);
    CheckBind(sqlite3_bind_int64(st.get(), idx, after), st.get());

    return std::make_unique<SqliteEdgeCursor>(std::move(st));
}

std::unique_ptr<EdgeCursor> SqliteRepository::EdgesFrom(Transaction& t, const util::UUID& source, model::EdgeHandle after) {
    return OpenCursor(t, sql::SELECT_LINKS_FROM, after, source);
}

std::unique_ptr<EdgeCursor> SqliteRepository::EdgesFromWithKey(Transaction& t, const util::UUID& source,
                                                               const util::UUID& key, model::EdgeHandle after) {
    return OpenCursor(t, sql::SELECT_LINKS_FROM_WITH_KEY, after, source, &key);
}

std::unique_ptr<EdgeCursor> SqliteRepository::EdgesByKey(Transaction& t, const util::UUID& key, model::EdgeHandle after) {
    return OpenCursor(t, sql::SELECT_LINKS_BY_KEY, after, key);
}

std::unique_ptr<EdgeCursor> SqliteRepository::EdgesTo(Transaction& t, const util::UUID& target, model::EdgeHandle after) {
    return OpenCursor(t, sql::SELECT_LINKS_TO, after, target);
}

uint64_t SqliteRepository::CountLinks(Transaction& t) {
    return static_cast<uint64_t>(TX(t).DB().QueryInt64(sql::COUNT_LINKS));
}

}
