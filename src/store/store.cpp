#include "store/store.hpp"
#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <sstream>
#include <vector>

namespace bucketd {
namespace store {

namespace {

constexpr char FILE_MAGIC[4] = {'B', 'K', 'T', 'D'};
constexpr uint32_t FILE_VERSION = 2;

// Marks a commit log record after the snapshot
constexpr uint8_t RECORD_COMMIT = 0xC0;

constexpr uint8_t ENTRY_BUCKET = 1;
constexpr uint8_t ENTRY_VALUE = 2;

void check_key(const std::string& key) {
  if (key.empty()) {
    throw StoreError("Store: Key required");
  }
}

} // namespace

//==============================================
// BUCKET
//==============================================

Bucket::Bucket(Transaction& tx, NodePtr node, std::vector<std::string> path)
  : tx_(&tx), node_(std::move(node)), path_(std::move(path)) {}

std::vector<std::string> Bucket::path_to(const std::string& key) const {
  std::vector<std::string> path = path_;
  path.push_back(key);
  return path;
}

std::optional<Bucket> Bucket::bucket(const std::string& name) const {
  tx_->check_open();

  auto it = node_->entries.find(name);
  if (it == node_->entries.end()) {
    return std::nullopt;
  }
  const NodePtr* child = std::get_if<NodePtr>(&it->second);
  if (!child) {
    return std::nullopt;
  }

  if (tx_->writable()) {
    // Writable handles only ever point at nodes owned by their transaction
    NodePtr owned = tx_->make_owned(*child);
    it->second = owned;
    return Bucket(*tx_, owned, path_to(name));
  }
  return Bucket(*tx_, *child, path_to(name));
}

Bucket Bucket::create_bucket_if_not_exists(const std::string& name) {
  tx_->check_writable();
  check_key(name);

  auto it = node_->entries.find(name);
  if (it == node_->entries.end()) {
    auto node = std::make_shared<Node>();
    node->owner = tx_->id();
    node_->entries.emplace(name, node);
    tx_->record({Change::Kind::CreateBucket, path_to(name), nullptr});
    return Bucket(*tx_, node, path_to(name));
  }

  const NodePtr* child = std::get_if<NodePtr>(&it->second);
  if (!child) {
    throw IncompatibleValue(name);
  }
  NodePtr owned = tx_->make_owned(*child);
  it->second = owned;
  return Bucket(*tx_, owned, path_to(name));
}

void Bucket::delete_bucket(const std::string& name) {
  tx_->check_writable();

  auto it = node_->entries.find(name);
  if (it == node_->entries.end()) {
    throw BucketNotFound(name);
  }
  if (!std::holds_alternative<NodePtr>(it->second)) {
    throw IncompatibleValue(name);
  }
  node_->entries.erase(it);
  tx_->record({Change::Kind::DeleteBucket, path_to(name), nullptr});
}

ValuePtr Bucket::get(const std::string& key) const {
  tx_->check_open();

  auto it = node_->entries.find(key);
  if (it == node_->entries.end()) {
    return nullptr;
  }
  const ValuePtr* value = std::get_if<ValuePtr>(&it->second);
  return value ? *value : nullptr;
}

void Bucket::put(const std::string& key, const std::string& value) {
  tx_->check_writable();
  check_key(key);

  auto it = node_->entries.find(key);
  if (it != node_->entries.end() && std::holds_alternative<NodePtr>(it->second)) {
    throw IncompatibleValue(key);
  }
  auto stored = std::make_shared<const std::string>(value);
  node_->entries[key] = stored;
  tx_->record({Change::Kind::Put, path_to(key), stored});
}

void Bucket::remove(const std::string& key) {
  tx_->check_writable();

  auto it = node_->entries.find(key);
  if (it == node_->entries.end()) {
    return;
  }
  if (std::holds_alternative<NodePtr>(it->second)) {
    throw IncompatibleValue(key);
  }
  node_->entries.erase(it);
  tx_->record({Change::Kind::Remove, path_to(key), nullptr});
}

void Bucket::for_each(const std::function<void(const std::string&, bool)>& visit) const {
  tx_->check_open();
  for (const auto& [key, entry] : node_->entries) {
    visit(key, std::holds_alternative<NodePtr>(entry));
  }
}

std::size_t Bucket::size() const {
  tx_->check_open();
  return node_->entries.size();
}


//==============================================
// TRANSACTION
//==============================================

Transaction::Transaction(Database& database, bool writable, uint64_t id, NodePtr root,
                         std::unique_lock<std::mutex> writer_lock)
  : database_(database)
  , writable_(writable)
  , id_(id)
  , open_(true)
  , root_(std::move(root))
  , writer_lock_(std::move(writer_lock)) {
  if (writable_) {
    root_ = make_owned(root_);
  }
}

Transaction::~Transaction() {
  rollback();
}

std::optional<Bucket> Transaction::bucket(const std::string& name) {
  return root_bucket().bucket(name);
}

Bucket Transaction::create_bucket_if_not_exists(const std::string& name) {
  return root_bucket().create_bucket_if_not_exists(name);
}

void Transaction::delete_bucket(const std::string& name) {
  root_bucket().delete_bucket(name);
}

void Transaction::commit() {
  check_writable();

  try {
    database_.publish(root_, changes_);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Commit of transaction " << id_ << " failed: " << e.what();
    rollback();
    throw;
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Committed transaction " << id_ << " with " << changes_.size() << " changes";
  open_ = false;
  root_.reset();
  changes_.clear();
  writer_lock_.unlock();
}

void Transaction::rollback() {
  if (!open_) {
    return;
  }
  open_ = false;
  root_.reset();
  changes_.clear();
  if (writer_lock_.owns_lock()) {
    writer_lock_.unlock();
  }
  BOOST_LOG_TRIVIAL(trace) << "Store: Closed transaction " << id_;
}

void Transaction::check_open() const {
  if (!open_) {
    throw TxClosed();
  }
}

void Transaction::check_writable() const {
  check_open();
  if (!writable_) {
    throw TxNotWritable();
  }
}

NodePtr Transaction::make_owned(const NodePtr& node) const {
  if (node->owner == id_) {
    return node;
  }
  // Shallow copy: children stay shared until this transaction walks into them
  auto copy = std::make_shared<Node>(*node);
  copy->owner = id_;
  return copy;
}

Bucket Transaction::root_bucket() {
  check_open();
  return Bucket(*this, root_, {});
}

void Transaction::record(Change change) {
  changes_.push_back(std::move(change));
}


//==============================================
// DATABASE
//==============================================

Database::Database(const std::string& path) : path_(path), root_(std::make_shared<Node>()) {
  if (in_memory()) {
    BOOST_LOG_TRIVIAL(info) << "Store: Opened in-memory database";
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Opening database file: " << path_.string();
  if (std::filesystem::exists(path_)) {
    load();
    open_log();
  } else {
    if (path_.has_parent_path()) {
      std::filesystem::create_directories(path_.parent_path());
    }
    write_snapshot(*root_);
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Database ready with " << root_->entries.size() << " top level buckets";
}

std::unique_ptr<Transaction> Database::begin(bool writable) {
  std::unique_lock<std::mutex> writer_lock;
  if (writable) {
    writer_lock = std::unique_lock<std::mutex>(writer_mutex_);
  }

  uint64_t id = next_tx_id_++;
  BOOST_LOG_TRIVIAL(trace) << "Store: Beginning " << (writable ? "writable" : "read-only")
                           << " transaction " << id;
  return std::unique_ptr<Transaction>(
    new Transaction(*this, writable, id, snapshot(), std::move(writer_lock)));
}

void Database::compact() {
  if (in_memory()) {
    return;
  }
  std::lock_guard<std::mutex> writer_lock(writer_mutex_);
  write_snapshot(*snapshot());
}

NodePtr Database::snapshot() const {
  std::lock_guard<std::mutex> lock(root_mutex_);
  return root_;
}

// Called with the writer lock held
void Database::publish(NodePtr root, const std::vector<Change>& changes) {
  if (!in_memory() && !changes.empty()) {
    append_commit(changes);
  }
  {
    std::lock_guard<std::mutex> lock(root_mutex_);
    root_ = root;
  }

  if (!in_memory() && log_size_ > std::max(MIN_COMPACTION_LOG_SIZE, snapshot_size_)) {
    // The commit is already durable in the log, a failed compaction only delays the rewrite
    try {
      write_snapshot(*root);
    } catch (const StoreError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Compaction failed, keeping commit log: " << e.what();
    }
  }
}


//==============================================
// FILE FORMAT
//==============================================

void Database::load() {
  std::ifstream file(path_, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open database file: " + path_.string());
  }

  try {
    char magic[sizeof(FILE_MAGIC)];
    read_bytes(file, magic, sizeof(magic));
    if (!std::equal(std::begin(magic), std::end(magic), std::begin(FILE_MAGIC))) {
      throw StoreError("Store: Not a database file: " + path_.string());
    }

    uint32_t version;
    read_bytes(file, &version, sizeof(version));
    version = boost::endian::big_to_native(version);
    if (version != FILE_VERSION) {
      throw StoreError("Store: Unsupported database version: " + std::to_string(version));
    }

    root_ = read_node(file);
    snapshot_size_ = static_cast<uint64_t>(file.tellg());
  } catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to load database: " << e.what();
    throw;
  }

  // Replay the commit log on top of the snapshot
  const uint64_t file_size = std::filesystem::file_size(path_);
  uint64_t end = snapshot_size_;
  std::size_t commits = 0;
  std::vector<Change> changes;
  while (read_commit(file, file_size - end, changes)) {
    for (const auto& change : changes) {
      apply(*root_, change);
    }
    end = static_cast<uint64_t>(file.tellg());
    ++commits;
  }
  log_size_ = end - snapshot_size_;

  if (end < file_size) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Dropping incomplete commit record of " << (file_size - end)
                               << " bytes at the end of " << path_.string();
    file.close();
    std::filesystem::resize_file(path_, end);
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Replayed " << commits << " commits from the log";
}

void Database::write_snapshot(const Node& root) {
  std::filesystem::path temp_path = path_;
  temp_path += ".tmp";

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp_path.string());
    }

    write_bytes(file, FILE_MAGIC, sizeof(FILE_MAGIC));
    uint32_t version = boost::endian::native_to_big(FILE_VERSION);
    write_bytes(file, &version, sizeof(version));
    write_node(file, root);

    file.flush();
    if (!file) {
      throw StoreError("Store: Failed to write file: " + temp_path.string());
    }
  }

  log_.close();
  std::error_code ec;
  std::filesystem::rename(temp_path, path_, ec);
  if (ec) {
    open_log();
    throw StoreError("Store: Failed to replace database file: " + ec.message());
  }

  snapshot_size_ = std::filesystem::file_size(path_);
  log_size_ = 0;
  open_log();
  BOOST_LOG_TRIVIAL(debug) << "Store: Wrote snapshot of " << snapshot_size_ << " bytes to " << path_.string();
}

void Database::open_log() {
  log_.clear();
  log_.open(path_, std::ios::binary | std::ios::app);
  if (!log_) {
    throw StoreError("Store: Failed to open database file for appending: " + path_.string());
  }
}

void Database::append_commit(const std::vector<Change>& changes) {
  std::ostringstream payload;
  uint32_t count = boost::endian::native_to_big(static_cast<uint32_t>(changes.size()));
  write_bytes(payload, &count, sizeof(count));

  for (const auto& change : changes) {
    uint8_t kind = static_cast<uint8_t>(change.kind);
    write_bytes(payload, &kind, sizeof(kind));

    uint32_t depth = boost::endian::native_to_big(static_cast<uint32_t>(change.path.size()));
    write_bytes(payload, &depth, sizeof(depth));
    for (const auto& segment : change.path) {
      write_string(payload, segment);
    }
    if (change.kind == Change::Kind::Put) {
      write_string(payload, *change.value);
    }
  }

  const std::string body = payload.str();
  uint64_t length = boost::endian::native_to_big(static_cast<uint64_t>(body.size()));

  try {
    write_bytes(log_, &RECORD_COMMIT, sizeof(RECORD_COMMIT));
    write_bytes(log_, &length, sizeof(length));
    write_bytes(log_, body.data(), body.size());
    if (!log_.flush()) {
      throw StoreError("Store: Failed to flush database file");
    }
  } catch (const StoreError&) {
    // Cut off whatever part of the record reached the file
    log_.close();
    std::error_code ec;
    std::filesystem::resize_file(path_, snapshot_size_ + log_size_, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to truncate partial commit record: " << ec.message();
    }
    open_log();
    throw;
  }

  log_size_ += sizeof(RECORD_COMMIT) + sizeof(length) + body.size();
}

bool Database::read_commit(std::istream& input, uint64_t available, std::vector<Change>& changes) {
  changes.clear();

  uint8_t record;
  if (!input.read(reinterpret_cast<char*>(&record), sizeof(record))) {
    return false;
  }
  if (record != RECORD_COMMIT) {
    throw StoreError("Store: Corrupt commit record type: " + std::to_string(record));
  }

  uint64_t length;
  if (!input.read(reinterpret_cast<char*>(&length), sizeof(length))) {
    return false;
  }
  length = boost::endian::big_to_native(length);
  if (length > available - sizeof(record) - sizeof(length)) {
    return false;
  }

  std::string body(length, '\0');
  if (length > 0 && !input.read(body.data(), body.size())) {
    return false;
  }

  std::istringstream payload(body);
  try {
    uint32_t count;
    read_bytes(payload, &count, sizeof(count));
    count = boost::endian::big_to_native(count);

    for (uint32_t i = 0; i < count; ++i) {
      Change change;
      uint8_t kind;
      read_bytes(payload, &kind, sizeof(kind));
      if (kind < static_cast<uint8_t>(Change::Kind::Put) || kind > static_cast<uint8_t>(Change::Kind::DeleteBucket)) {
        throw StoreError("Store: Corrupt change kind: " + std::to_string(kind));
      }
      change.kind = static_cast<Change::Kind>(kind);

      uint32_t depth;
      read_bytes(payload, &depth, sizeof(depth));
      depth = boost::endian::big_to_native(depth);
      if (depth == 0) {
        throw StoreError("Store: Change without a key");
      }
      for (uint32_t d = 0; d < depth; ++d) {
        change.path.push_back(read_string(payload));
      }
      if (change.kind == Change::Kind::Put) {
        change.value = std::make_shared<const std::string>(read_string(payload));
      }
      changes.push_back(std::move(change));
    }
  } catch (const StoreError& e) {
    // The record is complete, so a bad payload is corruption rather than an interrupted write
    throw StoreError(std::string("Store: Corrupt commit record: ") + e.what());
  }
  return true;
}

void Database::apply(Node& root, const Change& change) {
  Node* node = &root;
  for (std::size_t i = 0; i + 1 < change.path.size(); ++i) {
    auto it = node->entries.find(change.path[i]);
    const NodePtr* child = it == node->entries.end() ? nullptr : std::get_if<NodePtr>(&it->second);
    if (!child) {
      throw StoreError("Store: Commit log refers to missing bucket: " + change.path[i]);
    }
    node = child->get();
  }

  const std::string& key = change.path.back();
  switch (change.kind) {
    case Change::Kind::Put:
      node->entries[key] = change.value;
      break;
    case Change::Kind::Remove:
    case Change::Kind::DeleteBucket:
      node->entries.erase(key);
      break;
    case Change::Kind::CreateBucket:
      node->entries.emplace(key, std::make_shared<Node>());
      break;
  }
}

void Database::write_node(std::ostream& output, const Node& node) {
  uint64_t count = boost::endian::native_to_big(static_cast<uint64_t>(node.entries.size()));
  write_bytes(output, &count, sizeof(count));

  for (const auto& [key, entry] : node.entries) {
    const NodePtr* child = std::get_if<NodePtr>(&entry);
    uint8_t kind = child ? ENTRY_BUCKET : ENTRY_VALUE;
    write_bytes(output, &kind, sizeof(kind));

    uint32_t key_length = boost::endian::native_to_big(static_cast<uint32_t>(key.size()));
    write_bytes(output, &key_length, sizeof(key_length));
    write_bytes(output, key.data(), key.size());

    if (child) {
      write_node(output, **child);
    } else {
      const std::string& value = *std::get<ValuePtr>(entry);
      uint64_t value_length = boost::endian::native_to_big(static_cast<uint64_t>(value.size()));
      write_bytes(output, &value_length, sizeof(value_length));
      write_bytes(output, value.data(), value.size());
    }
  }
}

NodePtr Database::read_node(std::istream& input) {
  auto node = std::make_shared<Node>();

  uint64_t count;
  read_bytes(input, &count, sizeof(count));
  count = boost::endian::big_to_native(count);

  for (uint64_t i = 0; i < count; ++i) {
    uint8_t kind;
    read_bytes(input, &kind, sizeof(kind));

    uint32_t key_length;
    read_bytes(input, &key_length, sizeof(key_length));
    key_length = boost::endian::big_to_native(key_length);
    std::string key(key_length, '\0');
    read_bytes(input, key.data(), key.size());

    if (kind == ENTRY_BUCKET) {
      node->entries.emplace(std::move(key), read_node(input));
    } else if (kind == ENTRY_VALUE) {
      uint64_t value_length;
      read_bytes(input, &value_length, sizeof(value_length));
      value_length = boost::endian::big_to_native(value_length);
      std::string value(value_length, '\0');
      read_bytes(input, value.data(), value.size());
      node->entries.emplace(std::move(key), std::make_shared<const std::string>(std::move(value)));
    } else {
      throw StoreError("Store: Corrupt entry kind: " + std::to_string(kind));
    }
  }
  return node;
}

void Database::write_string(std::ostream& output, const std::string& text) {
  uint64_t length = boost::endian::native_to_big(static_cast<uint64_t>(text.size()));
  write_bytes(output, &length, sizeof(length));
  write_bytes(output, text.data(), text.size());
}

std::string Database::read_string(std::istream& input) {
  uint64_t length;
  read_bytes(input, &length, sizeof(length));
  length = boost::endian::big_to_native(length);
  std::string text(length, '\0');
  read_bytes(input, text.data(), text.size());
  return text;
}

void Database::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size > 0 && !output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write " << size << " bytes to database file";
    throw StoreError("Store: Failed to write to database file");
  }
}

void Database::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size > 0 && !input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to read " << size << " bytes from database file";
    throw StoreError("Store: Truncated database file");
  }
}

} // namespace store
} // namespace bucketd
