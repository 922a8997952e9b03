#pragma once

namespace evolve::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  Column order of PROGRAM_COLUMNS is relied on by the row readers.
*/

#define EVOLVE_PROGRAM_COLUMNS                                                                        \
  "id,code,parent_id,generation,experiment,sharpe,calmar,max_dd,cagr,total_return,trade_count,win_rate," \
  "psr,net_sharpe,created_at_us"

static constexpr const char* INSERT_PROGRAM =
    "INSERT INTO programs(" EVOLVE_PROGRAM_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PROGRAM =
    "SELECT " EVOLVE_PROGRAM_COLUMNS " FROM programs WHERE id=?;";

// filters are appended by the repository
static constexpr const char* SELECT_PROGRAMS =
    "SELECT " EVOLVE_PROGRAM_COLUMNS " FROM programs WHERE 1=1";

static constexpr const char* UPDATE_METRICS =
    "UPDATE programs SET sharpe=?,calmar=?,max_dd=?,cagr=?,total_return=?,trade_count=?,win_rate=?,psr=?,net_sharpe=?"
    " WHERE id=?;";

static constexpr const char* DELETE_PROGRAM =
    "DELETE FROM programs WHERE id=?;";

static constexpr const char* COUNT_PROGRAMS =
    "SELECT COUNT(*) FROM programs;";

static constexpr const char* COUNT_PROGRAMS_BY_EXPERIMENT =
    "SELECT COUNT(*) FROM programs WHERE experiment=?;";

static constexpr const char* SELECT_EXPERIMENTS =
    "SELECT experiment,COUNT(*),MAX(calmar),MIN(created_at_us) FROM programs"
    " WHERE experiment IS NOT NULL GROUP BY experiment ORDER BY MIN(created_at_us) DESC;";

// pruned programs count too, so restarts never reuse a timestamp
static constexpr const char* SELECT_MAX_CREATED_AT =
    "SELECT MAX(m) FROM (SELECT MAX(created_at_us) AS m FROM programs"
    " UNION ALL SELECT MAX(created_at_us) FROM program_tombstones);";

// tombstones

static constexpr const char* INSERT_TOMBSTONE =
    "INSERT INTO program_tombstones(id,generation,experiment,created_at_us,pruned_at_us) VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_TOMBSTONE =
    "SELECT id,generation,experiment,created_at_us,pruned_at_us FROM program_tombstones WHERE id=?;";

} // namespace evolve::db::sql
