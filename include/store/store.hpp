#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace bucketd {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Raised when a named bucket does not exist
class BucketNotFound : public StoreError {
public:
  explicit BucketNotFound(const std::string& name)
    : StoreError("Store: Bucket not found: " + name) {}
};

// Raised when a key holds a bucket where a value is expected, or the reverse
class IncompatibleValue : public StoreError {
public:
  explicit IncompatibleValue(const std::string& key)
    : StoreError("Store: Incompatible value for key: " + key) {}
};

class TxClosed : public StoreError {
public:
  TxClosed() : StoreError("Store: Transaction is closed") {}
};

class TxNotWritable : public StoreError {
public:
  TxNotWritable() : StoreError("Store: Transaction is read-only") {}
};

struct Node;
using NodePtr = std::shared_ptr<Node>;
using ValuePtr = std::shared_ptr<const std::string>;

// A key names either a nested bucket or a value, never both
using Entry = std::variant<NodePtr, ValuePtr>;

struct Node {
  std::map<std::string, Entry> entries;
  // Id of the writable transaction that may modify this node in place
  uint64_t owner = 0;
};

// One mutation of a writable transaction, replayed in order from the commit log
struct Change {
  enum class Kind : uint8_t {
    Put = 1,
    Remove = 2,
    CreateBucket = 3,
    DeleteBucket = 4
  };

  Kind kind;
  // Bucket names from the root, ending with the affected key
  std::vector<std::string> path;
  // Only set for Put
  ValuePtr value;
};

class Database;
class Transaction;

class Bucket {
public:
  // ---- NESTED BUCKETS ----
  // Returns the nested bucket, or nothing if the key is missing or holds a value
  std::optional<Bucket> bucket(const std::string& name) const;
  Bucket create_bucket_if_not_exists(const std::string& name);
  // Removes a nested bucket together with everything below it
  void delete_bucket(const std::string& name);


  // ---- VALUES ----
  // Returns nullptr if the key is missing or holds a bucket
  ValuePtr get(const std::string& key) const;
  void put(const std::string& key, const std::string& value);
  // Missing keys are ignored
  void remove(const std::string& key);


  // ---- ENUMERATION ----
  // Visits every key in byte order
  void for_each(const std::function<void(const std::string& key, bool is_bucket)>& visit) const;
  std::size_t size() const;

private:
  friend class Transaction;

  Bucket(Transaction& tx, NodePtr node, std::vector<std::string> path);

  std::vector<std::string> path_to(const std::string& key) const;

  Transaction* tx_;
  NodePtr node_;
  std::vector<std::string> path_;
};

class Transaction {
public:
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;


  // ---- TOP LEVEL BUCKETS ----
  std::optional<Bucket> bucket(const std::string& name);
  Bucket create_bucket_if_not_exists(const std::string& name);
  void delete_bucket(const std::string& name);


  // ---- COMPLETION ----
  // Persists and publishes the changes of a writable transaction
  void commit();
  // Discards all changes. Does nothing on a closed transaction
  void rollback();


  // ---- QUERY OPERATIONS ----
  bool writable() const { return writable_; }
  bool is_open() const { return open_; }
  uint64_t id() const { return id_; }

private:
  friend class Database;
  friend class Bucket;

  Transaction(Database& database, bool writable, uint64_t id, NodePtr root,
              std::unique_lock<std::mutex> writer_lock);

  void check_open() const;
  void check_writable() const;
  // Returns a node this transaction may modify, cloning it if needed
  NodePtr make_owned(const NodePtr& node) const;
  Bucket root_bucket();
  void record(Change change);

  Database& database_;
  const bool writable_;
  const uint64_t id_;
  bool open_;
  NodePtr root_;
  std::vector<Change> changes_;
  std::unique_lock<std::mutex> writer_lock_;
};

class Database {
public:
  // Commit log size below which no compaction happens
  static constexpr uint64_t MIN_COMPACTION_LOG_SIZE = 4 << 20;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens or creates the database file. An empty path keeps everything in memory.
  // A commit record cut short by a crash is dropped on open
  explicit Database(const std::string& path = "");
  ~Database() = default;

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;


  // ---- TRANSACTIONS ----
  // Writable transactions are serialized: this blocks while another one is open.
  // Read-only transactions see the state of the last commit before they began
  std::unique_ptr<Transaction> begin(bool writable);


  // ---- MAINTENANCE ----
  // Rewrites the file as a single snapshot of the committed state and empties the commit log.
  // Runs automatically once the log outgrows the snapshot. Blocks while a writable transaction is open
  void compact();


  // ---- QUERY OPERATIONS ----
  const std::filesystem::path& path() const { return path_; }
  bool in_memory() const { return path_.empty(); }
  // Bytes of commit records appended since the last snapshot
  uint64_t log_size() const { return log_size_; }

private:
  friend class Transaction;

  // Root of the last committed state
  NodePtr snapshot() const;
  // Appends the changes to the commit log and makes the new root visible to new transactions
  void publish(NodePtr root, const std::vector<Change>& changes);


  // ---- FILE FORMAT ----
  void load();
  void write_snapshot(const Node& root);
  void append_commit(const std::vector<Change>& changes);
  void open_log();
  // False if the input ends before a complete commit record. available counts the unread bytes
  static bool read_commit(std::istream& input, uint64_t available, std::vector<Change>& changes);
  static void apply(Node& root, const Change& change);
  static void write_node(std::ostream& output, const Node& node);
  static NodePtr read_node(std::istream& input);
  static void write_string(std::ostream& output, const std::string& text);
  static std::string read_string(std::istream& input);
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);

  std::filesystem::path path_;

  mutable std::mutex root_mutex_;
  NodePtr root_;

  // Commit log, appended after the snapshot in the same file
  std::ofstream log_;
  uint64_t snapshot_size_ = 0;
  uint64_t log_size_ = 0;

  std::mutex writer_mutex_;
  std::atomic<uint64_t> next_tx_id_{1};
};

} // namespace store
} // namespace bucketd
