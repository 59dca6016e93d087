#include "miniyaml/lsp/query_system.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

#include "miniyaml/query/type_data.hpp"

namespace miniyaml::lsp
{

namespace
{

WorkLimits limits_from(const ServerSettings & settings)
{
  WorkLimits limits;
  limits.request_timeout = settings.request_timeout;
  limits.max_similar_concurrent_work = settings.max_similar_concurrent_work;
  limits.max_concurrent_work = settings.max_concurrent_work;
  return limits;
}

/// Client position to the scalar-value position the database works in.
std::optional<Position> to_scalar_position(
  const query::Database & db, FileId file_id, Position position, PositionEncoding encoding)
{
  if (encoding == PositionEncoding::Utf32) {
    return position;
  }
  const auto text = db.file_text(file_id);
  const auto offsets = db.line_start_offsets(file_id);
  if (!text || !offsets) {
    return std::nullopt;
  }
  return convert_position(*text, *offsets, position, encoding, PositionEncoding::Utf32);
}

/// Scalar-value position back to the client's unit.
Position from_scalar_position(
  const query::Database & db, FileId file_id, Position position, PositionEncoding encoding)
{
  if (encoding == PositionEncoding::Utf32) {
    return position;
  }
  const auto text = db.file_text(file_id);
  const auto offsets = db.line_start_offsets(file_id);
  if (!text || !offsets) {
    return position;
  }
  return convert_position(*text, *offsets, position, PositionEncoding::Utf32, encoding)
    .value_or(position);
}

void convert_symbol_ranges(
  const query::Database & db, FileId file_id, std::vector<query::Symbol> & symbols,
  PositionEncoding encoding)
{
  for (auto & symbol : symbols) {
    symbol.range.start = from_scalar_position(db, file_id, symbol.range.start, encoding);
    symbol.range.end_exclusive =
      from_scalar_position(db, file_id, symbol.range.end_exclusive, encoding);
    if (symbol.children) {
      convert_symbol_ranges(db, file_id, *symbol.children, encoding);
    }
  }
}

}  // namespace

// ============================================================================
// ReplySlot
// ============================================================================

/// Shared by the actor and the worker serving one read. Whoever claims the
/// slot first sends the reply; the worker marks it finished once it is done.
class QuerySystem::ReplySlot
{
public:
  [[nodiscard]] bool claim()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (claimed_) {
      return false;
    }
    claimed_ = true;
    return true;
  }

  void finish()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      finished_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool finished() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
  }

  /// False when the deadline passed first.
  [[nodiscard]] bool wait_until(WorkPool::Clock::time_point deadline)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_until(lock, deadline, [this] { return finished_; });
  }

  void wait()
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return finished_; });
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool claimed_ = false;
  bool finished_ = false;
};

QuerySystem::QuerySystem(ResponseSink sink, QuerySystemOptions options)
: sink_(std::move(sink)),
  options_(std::move(options)),
  encoding_(options_.position_encoding),
  pool_(std::make_unique<WorkPool>(options_.limits))
{
  if (options_.event_hook) {
    db_.set_event_hook(options_.event_hook);
  }
}

QuerySystem::~QuerySystem()
{
  stop();
  await_replies();
  // Workers reply through `this`; join them while the sink is still alive.
  retired_pools_.clear();
  pool_.reset();
}

void QuerySystem::post(Message message)
{
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    inbox_.push_back(Envelope{std::move(message), WorkPool::Clock::now()});
  }
  inbox_cv_.notify_one();
}

void QuerySystem::start()
{
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    stopping_ = false;
  }
  thread_ = std::thread([this] { run(); });
}

void QuerySystem::stop()
{
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    stopping_ = true;
  }
  inbox_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void QuerySystem::process_pending()
{
  std::deque<Envelope> pending;
  take_inbox(pending);
  while (!pending.empty()) {
    on_new_messages(pending);
    await_replies();
    if (needs_diagnostics_) {
      publish_diagnostics();
    }
    take_inbox(pending);
  }
}

void QuerySystem::run()
{
  std::deque<Envelope> pending;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(inbox_mutex_);
      const auto ready = [&] { return stopping_ || !inbox_.empty() || !pending.empty(); };
      if (pending_replies_.empty()) {
        inbox_cv_.wait(lock, ready);
      } else {
        const auto next = std::min_element(
          pending_replies_.begin(), pending_replies_.end(),
          [](const PendingReply & a, const PendingReply & b) { return a.deadline < b.deadline; });
        inbox_cv_.wait_until(lock, next->deadline, ready);
      }
      if (stopping_ && inbox_.empty() && pending.empty()) {
        break;
      }
      std::move(inbox_.begin(), inbox_.end(), std::back_inserter(pending));
      inbox_.clear();
    }

    expire_replies(WorkPool::Clock::now());
    if (pending.empty()) {
      continue;
    }
    on_new_messages(pending);
    if (needs_diagnostics_) {
      publish_diagnostics();
    }
  }
  await_replies();
}

void QuerySystem::take_inbox(std::deque<Envelope> & pending)
{
  std::lock_guard<std::mutex> lock(inbox_mutex_);
  std::move(inbox_.begin(), inbox_.end(), std::back_inserter(pending));
  inbox_.clear();
}

void QuerySystem::on_new_messages(std::deque<Envelope> & pending)
{
  const auto last_mutating = std::find_if(pending.rbegin(), pending.rend(), [](const Envelope & e) {
    return is_mutating(e.message);
  });

  if (last_mutating != pending.rend()) {
    const auto end = last_mutating.base();  // one past the last mutating message
    std::deque<Envelope> kept_reads;
    for (auto it = pending.begin(); it != end; ++it) {
      if (is_mutating(it->message)) {
        apply(it->message);
      } else {
        kept_reads.push_back(std::move(*it));
      }
    }
    pending.erase(pending.begin(), end);
    pending.insert(
      pending.begin(), std::make_move_iterator(kept_reads.begin()),
      std::make_move_iterator(kept_reads.end()));

    needs_diagnostics_ = true;
  }

  if (!pending.empty()) {
    const Envelope envelope = std::move(pending.front());
    pending.pop_front();
    serve(envelope);
  }
}

// ============================================================================
// Mutations
// ============================================================================

void QuerySystem::apply(Message & message)
{
  spdlog::debug("applying {}", message_name(message));

  if (const auto * init = std::get_if<Initialize>(&message)) {
    on_initialize(*init);
  } else if (const auto * opened = std::get_if<FileOpened>(&message)) {
    on_file_opened(*opened);
  } else if (const auto * changed = std::get_if<FileChanged>(&message)) {
    on_file_changed(*changed);
  } else if (const auto * closed = std::get_if<FileClosed>(&message)) {
    on_file_closed(*closed);
  }
}

void QuerySystem::on_initialize(const Initialize & msg)
{
  if (msg.position_encoding) {
    encoding_ = *msg.position_encoding;
  }

  if (!msg.workspace_root) {
    spdlog::info("no workspace root; type data will not be loaded");
    return;
  }

  auto loaded = resolve_server_config(*msg.workspace_root);
  if (loaded.success) {
    config_ = std::move(loaded.config);
  } else {
    spdlog::error("invalid server configuration: {}", loaded.error);
    config_ = ServerConfig{};
    config_.config_root = *msg.workspace_root;
  }

  if (options_.apply_config_log_level) {
    spdlog::set_level(config_.server.log_level);
  }

  // The old pool is released once its jobs have drained.
  retired_pools_.push_back(std::move(pool_));
  pool_ = std::make_unique<WorkPool>(limits_from(config_.server));

  const auto type_data_path = config_.type_data_path();
  auto type_data = query::load_type_data(type_data_path);
  if (type_data.success) {
    spdlog::info("loaded {} trait(s) from {}", type_data.data->size(), type_data_path.string());
    db_.set_type_data(std::move(type_data.data));
  } else {
    spdlog::warn("type data unavailable: {}", type_data.error);
  }
}

void QuerySystem::on_file_opened(const FileOpened & msg)
{
  if (const auto existing = db_.file_id_of_file_path(msg.uri)) {
    db_.set_file_text(*existing, msg.text);
    mark_changed(*existing);
    return;
  }
  mark_changed(db_.add_file(msg.uri, msg.text));
}

void QuerySystem::on_file_changed(const FileChanged & msg)
{
  const auto file_id = db_.file_id_of_file_path(msg.uri);
  if (!file_id) {
    spdlog::warn("change for unknown document {}", msg.uri);
    return;
  }
  if (!db_.apply_edit(*file_id, msg.edits, encoding_)) {
    spdlog::warn("rejected edits for {}", msg.uri);
    return;
  }
  mark_changed(*file_id);
}

void QuerySystem::on_file_closed(const FileClosed & msg)
{
  const auto file_id = db_.file_id_of_file_path(msg.uri);
  if (!file_id) {
    return;
  }
  db_.remove_file(*file_id);
  changed_files_.erase(
    std::remove(changed_files_.begin(), changed_files_.end(), *file_id), changed_files_.end());
  closed_uris_.push_back(msg.uri);
}

void QuerySystem::mark_changed(FileId file_id)
{
  if (std::find(changed_files_.begin(), changed_files_.end(), file_id) == changed_files_.end()) {
    changed_files_.push_back(file_id);
  }
}

void QuerySystem::publish_diagnostics()
{
  for (const FileId file_id : changed_files_) {
    const auto uri = db_.file_path(file_id);
    const auto diags = db_.file_diagnostics(file_id);
    if (!uri || !diags) {
      continue;
    }

    PublishDiagnostics out;
    out.uri = *uri;
    for (const Diagnostic & d : *diags) {
      const ByteSpan span = d.primary_span();
      ProtocolDiagnostic pd;
      const Position start =
        db_.byte_index_to_position(file_id, span.start()).value_or(Position{});
      const Position end = db_.byte_index_to_position(file_id, span.end()).value_or(start);
      pd.range.start = from_scalar_position(db_, file_id, start, encoding_);
      pd.range.end_exclusive = from_scalar_position(db_, file_id, end, encoding_);
      pd.severity = d.severity;
      pd.code = d.code;
      pd.message = d.message;
      if (d.help_message) {
        pd.message += "\nhelp: " + *d.help_message;
      }
      out.diagnostics.push_back(std::move(pd));
    }
    send(std::move(out));
  }

  // Clear what the client still shows for closed documents.
  for (auto & uri : closed_uris_) {
    send(PublishDiagnostics{std::move(uri), {}});
  }

  changed_files_.clear();
  closed_uris_.clear();
  needs_diagnostics_ = false;
}

// ============================================================================
// Read-only requests
// ============================================================================

void QuerySystem::serve(const Envelope & envelope)
{
  spdlog::debug("serving {}", message_name(envelope.message));

  if (const auto * hover = std::get_if<HoverRequest>(&envelope.message)) {
    serve_hover(*hover, envelope.received_at);
  } else if (const auto * def = std::get_if<DefinitionRequest>(&envelope.message)) {
    serve_definition(*def, envelope.received_at);
  } else if (const auto * symbols = std::get_if<DocumentSymbolsRequest>(&envelope.message)) {
    serve_symbols(*symbols, envelope.received_at);
  }
}

template <typename T>
void QuerySystem::submit_read(
  const char * description, const RequestId & id, WorkPool::Clock::time_point received_at,
  std::function<T()> work, std::function<Response(T)> to_response, T fallback)
{
  auto slot = std::make_shared<ReplySlot>();
  pending_replies_.push_back(
    PendingReply{slot, received_at + pool_->limits().request_timeout, to_response(fallback)});

  pool_->submit<T>(
    description, received_at, std::move(work), std::move(fallback),
    [this, slot, id, to_response = std::move(to_response)](WorkResult<T> result) {
      if (slot->claim()) {
        try {
          if (result.status == WorkStatus::Failed) {
            send(ErrorResponse{id, k_internal_error, "internal error: " + result.error});
          } else {
            send(to_response(std::move(result.value)));
          }
        } catch (const std::exception & e) {
          spdlog::error("could not send the reply: {}", e.what());
        }
      }
      slot->finish();
    });
}

void QuerySystem::serve_hover(const HoverRequest & req, WorkPool::Clock::time_point received_at)
{
  const auto file_id = db_.file_id_of_file_path(req.uri);
  if (!file_id) {
    send(HoverResponse{req.id, std::nullopt});
    return;
  }

  auto snapshot = std::make_shared<query::Snapshot>(db_.snapshot());
  const Position position = req.position;
  const PositionEncoding encoding = encoding_;
  submit_read<std::optional<std::string>>(
    "textDocument/hover", req.id, received_at,
    [snapshot, id = *file_id, position, encoding]() -> std::optional<std::string> {
      const query::Database & db = **snapshot;
      const auto scalar = to_scalar_position(db, id, position, encoding);
      if (!scalar) {
        return std::nullopt;
      }
      return db.hover_at(id, *scalar);
    },
    [id = req.id](std::optional<std::string> contents) -> Response {
      return HoverResponse{id, std::move(contents)};
    },
    std::nullopt);
}

void QuerySystem::serve_definition(
  const DefinitionRequest & req, WorkPool::Clock::time_point received_at)
{
  const auto file_id = db_.file_id_of_file_path(req.uri);
  if (!file_id) {
    send(DefinitionResponse{req.id, std::nullopt});
    return;
  }

  auto snapshot = std::make_shared<query::Snapshot>(db_.snapshot());
  const Position position = req.position;
  const PositionEncoding encoding = encoding_;
  submit_read<std::optional<Location>>(
    "textDocument/definition", req.id, received_at,
    [snapshot, id = *file_id, position, encoding]() -> std::optional<Location> {
      const query::Database & db = **snapshot;
      const auto scalar = to_scalar_position(db, id, position, encoding);
      if (!scalar) {
        return std::nullopt;
      }
      const auto def = db.definition_at(id, *scalar);
      if (!def) {
        return std::nullopt;
      }
      const auto uri = db.file_path(def->file_id);
      if (!uri) {
        return std::nullopt;
      }
      return Location{
        *uri, PositionRange{
                from_scalar_position(db, def->file_id, def->start, encoding),
                from_scalar_position(db, def->file_id, def->end_exclusive, encoding)}};
    },
    [id = req.id](std::optional<Location> location) -> Response {
      return DefinitionResponse{id, std::move(location)};
    },
    std::nullopt);
}

void QuerySystem::serve_symbols(
  const DocumentSymbolsRequest & req, WorkPool::Clock::time_point received_at)
{
  const auto file_id = db_.file_id_of_file_path(req.uri);
  if (!file_id) {
    send(DocumentSymbolsResponse{req.id, std::nullopt});
    return;
  }

  auto snapshot = std::make_shared<query::Snapshot>(db_.snapshot());
  const PositionEncoding encoding = encoding_;
  submit_read<std::optional<std::vector<query::Symbol>>>(
    "textDocument/documentSymbol", req.id, received_at,
    [snapshot, id = *file_id, encoding] {
      const query::Database & db = **snapshot;
      auto symbols = db.symbols_in(id);
      if (symbols) {
        convert_symbol_ranges(db, id, *symbols, encoding);
      }
      return symbols;
    },
    [id = req.id](std::optional<std::vector<query::Symbol>> symbols) -> Response {
      return DocumentSymbolsResponse{id, std::move(symbols)};
    },
    std::nullopt);
}

void QuerySystem::expire_replies(WorkPool::Clock::time_point now)
{
  auto it = pending_replies_.begin();
  while (it != pending_replies_.end()) {
    if (it->slot->finished()) {
      it = pending_replies_.erase(it);
      continue;
    }
    if (now < it->deadline) {
      ++it;
      continue;
    }
    if (it->slot->claim()) {
      spdlog::debug("request overran its timeout; answering with an empty result");
      send(std::move(it->fallback));
    }
    it = pending_replies_.erase(it);
  }
  release_idle_pools();
}

void QuerySystem::await_replies()
{
  for (auto & reply : pending_replies_) {
    if (reply.slot->wait_until(reply.deadline)) {
      continue;
    }
    if (reply.slot->claim()) {
      spdlog::debug("request overran its timeout; answering with an empty result");
      send(std::move(reply.fallback));
    } else {
      // The worker is sending its own reply.
      reply.slot->wait();
    }
  }
  pending_replies_.clear();
  release_idle_pools();
}

void QuerySystem::release_idle_pools()
{
  retired_pools_.erase(
    std::remove_if(
      retired_pools_.begin(), retired_pools_.end(),
      [](const std::unique_ptr<WorkPool> & pool) { return pool->in_flight() == 0; }),
    retired_pools_.end());
}

void QuerySystem::send(Response response) const
{
  if (!sink_) {
    spdlog::error("internal error: no response sink");
    return;
  }
  sink_(std::move(response));
}

}  // namespace miniyaml::lsp
