#pragma once
#include "proxy_wallet.hpp"

#include <sqlite3.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Append-only journal of ProxyWalletRecord transitions
class WalletStateDB {
public:
    explicit WalletStateDB(std::string db_path,
                           int flush_ms = 200,
                           std::size_t max_queue = 10000);
    ~WalletStateDB();

    WalletStateDB(const WalletStateDB&) = delete;
    WalletStateDB& operator=(const WalletStateDB&) = delete;

    // Producer API (called by ProxyWalletManager after each transition)
    void push(ProxyWalletRecord rec);

    // Start/stop writer thread; stop() flushes what is queued
    bool start();
    void stop();

    // Latest row per owner. In-flight states come back as Unknown / Unapproved
    // because their outcome was never observed.
    std::vector<ProxyWalletRecord> load_latest();

private:
    bool open_connection(sqlite3** db);
    bool init_schema_and_pragmas(sqlite3* db);

    bool prepare_statements();
    void finalize_statements();

    void writer_loop();
    bool insert_batch(const std::vector<ProxyWalletRecord>& batch);

private:
    std::string db_path_;
    int flush_ms_;
    std::size_t max_queue_;

    sqlite3* db_{nullptr};
    sqlite3_stmt* stmt_insert_{nullptr};

    std::atomic<bool> running_{false};
    std::thread writer_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<ProxyWalletRecord> q_;
};
