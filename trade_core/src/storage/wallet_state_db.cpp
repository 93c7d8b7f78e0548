#include "wallet_state_db.hpp"
#include "trade_log.hpp"

#include <chrono>

static void log_sqlite_err(sqlite3* db, const char* where) {
    log_error("WalletStateDB", std::string(where) + " sqlite_err=" + (db ? sqlite3_errmsg(db) : "null-db"));
}

static bool exec_sql(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        log_error("WalletStateDB", std::string("sqlite_exec failed: ") + (err ? err : ""));
        sqlite3_free(err);
        return false;
    }
    return true;
}

static std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

WalletStateDB::WalletStateDB(std::string db_path, int flush_ms, std::size_t max_queue)
    : db_path_(std::move(db_path))
    , flush_ms_(flush_ms)
    , max_queue_(max_queue)
{}

WalletStateDB::~WalletStateDB() {
    stop();
}

bool WalletStateDB::start() {
    if (running_.exchange(true)) return true;

    if (!open_connection(&db_) || !init_schema_and_pragmas(db_) || !prepare_statements()) {
        running_ = false;
        finalize_statements();
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    writer_ = std::thread(&WalletStateDB::writer_loop, this);
    return true;
}

void WalletStateDB::stop() {
    if (!running_.exchange(false)) return;

    cv_.notify_all();
    if (writer_.joinable()) writer_.join();

    finalize_statements();
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void WalletStateDB::push(ProxyWalletRecord rec) {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (q_.size() >= max_queue_) {
            log_warn("WalletStateDB", "journal queue full, dropping oldest row");
            q_.pop_front();
        }
        q_.push_back(std::move(rec));
    }
    cv_.notify_one();
}

bool WalletStateDB::open_connection(sqlite3** db) {
    int rc = sqlite3_open(db_path_.c_str(), db);
    if (rc != SQLITE_OK) {
        log_sqlite_err(*db, "sqlite3_open");
        if (*db) sqlite3_close(*db);
        *db = nullptr;
        return false;
    }
    return true;
}

bool WalletStateDB::init_schema_and_pragmas(sqlite3* db) {
    if (!exec_sql(db, "PRAGMA journal_mode=WAL;")) return false;
    if (!exec_sql(db, "PRAGMA synchronous=NORMAL;")) return false;
    if (!exec_sql(db, "PRAGMA busy_timeout=2000;")) return false;

    const char* create_sql =
        "CREATE TABLE IF NOT EXISTS wallet_state ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  ts_ms INTEGER NOT NULL,"
        "  owner TEXT NOT NULL,"
        "  proxy_address TEXT NOT NULL,"
        "  state TEXT NOT NULL,"
        "  std_state TEXT NOT NULL, std_allowance REAL NOT NULL,"
        "  neg_state TEXT NOT NULL, neg_allowance REAL NOT NULL,"
        "  err_kind INTEGER,"
        "  err_msg TEXT,"
        "  tx_id TEXT NOT NULL,"
        "  tx_hash TEXT NOT NULL"
        ");";

    if (!exec_sql(db, create_sql)) return false;
    if (!exec_sql(db, "CREATE INDEX IF NOT EXISTS idx_wallet_state_owner ON wallet_state(owner, id);")) return false;
    return true;
}

bool WalletStateDB::prepare_statements() {
    const char* ins =
        "INSERT INTO wallet_state ("
        " ts_ms, owner, proxy_address, state, std_state, std_allowance, neg_state, neg_allowance,"
        " err_kind, err_msg, tx_id, tx_hash"
        ") VALUES (?,?,?,?,?,?,?,?,?,?,?,?);";

    int rc = sqlite3_prepare_v2(db_, ins, -1, &stmt_insert_, nullptr);
    if (rc != SQLITE_OK) {
        log_sqlite_err(db_, "sqlite3_prepare_v2(insert)");
        stmt_insert_ = nullptr;
        return false;
    }
    return true;
}

void WalletStateDB::finalize_statements() {
    if (stmt_insert_) {
        sqlite3_finalize(stmt_insert_);
        stmt_insert_ = nullptr;
    }
}

bool WalletStateDB::insert_batch(const std::vector<ProxyWalletRecord>& batch) {
    if (batch.empty()) return true;

    if (!exec_sql(db_, "BEGIN IMMEDIATE TRANSACTION;")) return false;

    for (const auto& r : batch) {
        sqlite3_reset(stmt_insert_);
        sqlite3_clear_bindings(stmt_insert_);

        const auto& std_ap = r.approval(ApprovalTarget::Standard);
        const auto& neg_ap = r.approval(ApprovalTarget::NegRisk);

        int idx = 1;
        sqlite3_bind_int64(stmt_insert_, idx++, static_cast<sqlite3_int64>(r.updated_ms));
        sqlite3_bind_text(stmt_insert_, idx++, r.owner.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, idx++, r.proxy_address.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, idx++, wallet_state_name(r.state), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt_insert_, idx++, approval_state_name(std_ap.state), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt_insert_, idx++, std_ap.allowance);
        sqlite3_bind_text(stmt_insert_, idx++, approval_state_name(neg_ap.state), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt_insert_, idx++, neg_ap.allowance);
        if (r.last_error) {
            sqlite3_bind_int(stmt_insert_, idx++, static_cast<int>(r.last_error->kind));
            sqlite3_bind_text(stmt_insert_, idx++, r.last_error->message.c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt_insert_, idx++);
            sqlite3_bind_null(stmt_insert_, idx++);
        }
        sqlite3_bind_text(stmt_insert_, idx++, r.last_tx_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, idx++, r.last_tx_hash.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt_insert_);
        if (rc != SQLITE_DONE) {
            log_sqlite_err(db_, "sqlite3_step(insert)");
            exec_sql(db_, "ROLLBACK;");
            return false;
        }
    }

    if (!exec_sql(db_, "COMMIT;")) {
        exec_sql(db_, "ROLLBACK;");
        return false;
    }
    return true;
}

void WalletStateDB::writer_loop() {
    std::vector<ProxyWalletRecord> batch;

    while (running_) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, std::chrono::milliseconds(flush_ms_), [&]{
            return !running_ || !q_.empty();
        });

        if (!running_ && q_.empty())
            break;

        batch.clear();
        while (!q_.empty()) {
            batch.push_back(std::move(q_.front()));
            q_.pop_front();
        }
        lk.unlock();

        if (!insert_batch(batch)) {
            log_error("WalletStateDB", "insert_batch failed (continuing)");
        }
    }

    // final flush on exit
    std::vector<ProxyWalletRecord> tail;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        while (!q_.empty()) {
            tail.push_back(std::move(q_.front()));
            q_.pop_front();
        }
    }
    if (!tail.empty() && !insert_batch(tail)) {
        log_error("WalletStateDB", "final flush failed, " + std::to_string(tail.size()) + " rows lost");
    }
}

std::vector<ProxyWalletRecord> WalletStateDB::load_latest() {
    std::vector<ProxyWalletRecord> out;

    sqlite3* db = nullptr;
    if (!open_connection(&db)) return out;
    if (!init_schema_and_pragmas(db)) {
        sqlite3_close(db);
        return out;
    }

    const char* sel =
        "SELECT owner, proxy_address, state, std_state, std_allowance, neg_state, neg_allowance,"
        " err_kind, err_msg, tx_id, tx_hash, ts_ms"
        " FROM wallet_state w"
        " WHERE id = (SELECT MAX(id) FROM wallet_state WHERE owner = w.owner)"
        " ORDER BY owner;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sel, -1, &st, nullptr) != SQLITE_OK) {
        log_sqlite_err(db, "sqlite3_prepare_v2(select)");
        sqlite3_close(db);
        return out;
    }

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        ProxyWalletRecord r;
        r.owner = column_text(st, 0);
        r.proxy_address = column_text(st, 1);
        r.state = parse_wallet_state(column_text(st, 2));
        r.approval(ApprovalTarget::Standard).state = parse_approval_state(column_text(st, 3));
        r.approval(ApprovalTarget::Standard).allowance = sqlite3_column_double(st, 4);
        r.approval(ApprovalTarget::NegRisk).state = parse_approval_state(column_text(st, 5));
        r.approval(ApprovalTarget::NegRisk).allowance = sqlite3_column_double(st, 6);
        if (sqlite3_column_type(st, 7) != SQLITE_NULL) {
            r.last_error = WalletError{static_cast<ErrorKind>(sqlite3_column_int(st, 7)), column_text(st, 8)};
        }
        r.last_tx_id = column_text(st, 9);
        r.last_tx_hash = column_text(st, 10);
        r.updated_ms = sqlite3_column_int64(st, 11);

        if (r.state == WalletState::Checking || r.state == WalletState::Deploying) r.state = WalletState::Unknown;
        for (auto& ap : r.approvals) {
            if (ap.state == ApprovalState::Approving) ap.state = ApprovalState::Unapproved;
        }
        out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) log_sqlite_err(db, "sqlite3_step(select)");

    sqlite3_finalize(st);
    sqlite3_close(db);
    return out;
}
