#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace evolve::db::sqlite {

using evolve::db::ErrorCode;
using evolve::db::Result;
using evolve::model::FitnessMetrics;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
    if (v) BindI64(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

static void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
    if (v) sqlite3_bind_double(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

// Binds the nine metric columns starting at idx; nulls when pending.
static void BindMetrics(sqlite3_stmt* st, int idx, const std::optional<FitnessMetrics>& m) {
    if (!m) {
        for (int i = 0; i < 9; ++i) sqlite3_bind_null(st, idx + i);
        return;
    }
    sqlite3_bind_double(st, idx + 0, m->sharpe_ratio);
    sqlite3_bind_double(st, idx + 1, m->calmar_ratio);
    sqlite3_bind_double(st, idx + 2, m->max_drawdown);
    sqlite3_bind_double(st, idx + 3, m->cagr);
    sqlite3_bind_double(st, idx + 4, m->total_return);
    BindOptI64(st, idx + 5, m->trade_count);
    BindOptDouble(st, idx + 6, m->win_rate);
    BindOptDouble(st, idx + 7, m->psr);
    BindOptDouble(st, idx + 8, m->net_sharpe);
}

static bool ColIsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (ColIsNull(st, col)) return std::nullopt;
    return ColText(st, col);
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (ColIsNull(st, col)) return std::nullopt;
    return ColI64(st, col);
}

static std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
    if (ColIsNull(st, col)) return std::nullopt;
    return sqlite3_column_double(st, col);
}

// Reads a row laid out as EVOLVE_PROGRAM_COLUMNS.
static model::ProgramRecord ReadProgram(sqlite3_stmt* st) {
    model::ProgramRecord r;
    r.id = ColText(st, 0);
    r.code = ColText(st, 1);
    r.parent_id = ColOptText(st, 2);
    r.generation = static_cast<uint32_t>(ColI64(st, 3));
    r.experiment = ColOptText(st, 4);

    // calmar decides pending vs scored
    if (!ColIsNull(st, 6)) {
        FitnessMetrics m;
        m.sharpe_ratio = sqlite3_column_double(st, 5);
        m.calmar_ratio = sqlite3_column_double(st, 6);
        m.max_drawdown = sqlite3_column_double(st, 7);
        m.cagr = sqlite3_column_double(st, 8);
        m.total_return = sqlite3_column_double(st, 9);
        m.trade_count = ColOptI64(st, 10);
        m.win_rate = ColOptDouble(st, 11);
        m.psr = ColOptDouble(st, 12);
        m.net_sharpe = ColOptDouble(st, 13);
        r.metrics = m;
    }

    r.created_at_us = ColI64(st, 14);
    return r;
}

static void ThrowStep(sqlite3* db, int rc, const char* what) {
    throw util::StorageError(std::string(what) + ": " + sqlite3_errstr(rc) + ": " + sqlite3_errmsg(db));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(AccessMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

SqliteTransaction& SqliteRepository::WriteTX(Transaction& t) {
    auto& tx = TX(t);
    if (tx.Mode() != AccessMode::kReadWrite) {
        throw util::InvalidState("write attempted in a read-only transaction");
    }
    return tx;
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Programs
// ------------------------------------------------------------------

Result SqliteRepository::InsertProgram(Transaction& t, const model::ProgramRecord& r) {
    auto* db = WriteTX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_PROGRAM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.code);
    BindOptText(st, 3, r.parent_id);
    BindI64(st, 4, r.generation);
    BindOptText(st, 5, r.experiment);
    BindMetrics(st, 6, r.metrics);
    BindI64(st, 15, r.created_at_us);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, r.id);
    return Translate(db, rc);
}

std::optional<model::ProgramRecord>
SqliteRepository::GetProgram(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_PROGRAM);
    BindText(st.Get(), 1, id);

    int rc = sqlite3_step(st.Get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowStep(db, rc, "select program");

    return ReadProgram(st.Get());
}

std::vector<model::ProgramRecord>
SqliteRepository::ListPrograms(Transaction& t, const ProgramFilter& filter) {
    auto* db = TX(t).Handle();

    std::string query = sql::SELECT_PROGRAMS;
    if (filter.experiment) query += " AND experiment=?";
    if (filter.scored_only) query += " AND calmar IS NOT NULL";
    if (filter.id_prefix) query += " AND substr(id,1,?)=?";
    query += ";";

    Statement st(db, query.c_str());
    int idx = 1;
    if (filter.experiment) BindText(st.Get(), idx++, *filter.experiment);
    if (filter.id_prefix) {
        BindI64(st.Get(), idx++, static_cast<int64_t>(filter.id_prefix->size()));
        BindText(st.Get(), idx++, *filter.id_prefix);
    }

    std::vector<model::ProgramRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.Get())) == SQLITE_ROW) {
        out.push_back(ReadProgram(st.Get()));
    }
    if (rc != SQLITE_DONE) ThrowStep(db, rc, "list programs");

    return out;
}

Result SqliteRepository::UpdateMetrics(Transaction& t, const std::string& id, const FitnessMetrics& metrics) {
    auto* db = WriteTX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_METRICS, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindMetrics(st, 1, metrics);
    BindText(st, 10, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, id);
    return result;
}

Result SqliteRepository::DeletePrograms(Transaction& t, const std::vector<std::string>& ids) {
    auto* db = WriteTX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_PROGRAM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& id : ids) {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
        BindText(st, 1, id);

        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto result = Translate(db, rc);
            sqlite3_finalize(st);
            return result;
        }
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

std::uint64_t SqliteRepository::CountPrograms(Transaction& t, const std::optional<std::string>& experiment) {
    auto* db = TX(t).Handle();

    Statement st(db, experiment ? sql::COUNT_PROGRAMS_BY_EXPERIMENT : sql::COUNT_PROGRAMS);
    if (experiment) BindText(st.Get(), 1, *experiment);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_ROW) ThrowStep(db, rc, "count programs");

    return static_cast<std::uint64_t>(ColI64(st.Get(), 0));
}

std::vector<model::ExperimentRecord> SqliteRepository::ListExperiments(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_EXPERIMENTS);

    std::vector<model::ExperimentRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.Get())) == SQLITE_ROW) {
        model::ExperimentRecord r;
        r.name = ColText(st.Get(), 0);
        r.count = static_cast<std::uint64_t>(ColI64(st.Get(), 1));
        r.best_calmar = ColOptDouble(st.Get(), 2);
        r.first_created_at_us = ColI64(st.Get(), 3);
        out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) ThrowStep(db, rc, "list experiments");

    return out;
}

std::optional<std::int64_t> SqliteRepository::MaxCreatedAt(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_MAX_CREATED_AT);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_ROW) ThrowStep(db, rc, "max created_at");

    return ColOptI64(st.Get(), 0);
}

// ------------------------------------------------------------------
// Tombstones
// ------------------------------------------------------------------

Result SqliteRepository::InsertTombstone(Transaction& t, const model::TombstoneRecord& r) {
    auto* db = WriteTX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_TOMBSTONE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindI64(st, 2, r.generation);
    BindOptText(st, 3, r.experiment);
    BindI64(st, 4, r.created_at_us);
    BindI64(st, 5, r.pruned_at_us);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, r.id);
    return Translate(db, rc);
}

std::optional<model::TombstoneRecord>
SqliteRepository::GetTombstone(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_TOMBSTONE);
    BindText(st.Get(), 1, id);

    int rc = sqlite3_step(st.Get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowStep(db, rc, "select tombstone");

    model::TombstoneRecord r;
    r.id = ColText(st.Get(), 0);
    r.generation = static_cast<uint32_t>(ColI64(st.Get(), 1));
    r.experiment = ColOptText(st.Get(), 2);
    r.created_at_us = ColI64(st.Get(), 3);
    r.pruned_at_us = ColI64(st.Get(), 4);
    return r;
}

void SqliteRepository::Flush() {
    std::scoped_lock lock(db_->Mutex());
    db_->Checkpoint();
}

} // namespace evolve::db::sqlite
