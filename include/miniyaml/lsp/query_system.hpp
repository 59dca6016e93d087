// miniyaml/lsp/query_system.hpp - Actor that owns the query database
//
// All state changes go through a single thread. Queued messages are handled
// in batches:
//
//   1. every mutating message up to the last mutating one is applied in
//      order; read-only messages seen on the way are kept, in order;
//   2. one read-only message is handed to the work pool together with a
//      snapshot; the worker sends the response, so the actor moves on to the
//      next batch without waiting for it;
//   3. if anything was mutated, diagnostics for the touched files are
//      published.
//
// A reader therefore never observes a partially applied batch of edits. A
// read still unanswered `request_timeout` after it arrived is answered with
// its empty result by the actor, and the late worker result is dropped.
//
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "miniyaml/basic/line_index.hpp"
#include "miniyaml/lsp/messages.hpp"
#include "miniyaml/lsp/work_pool.hpp"
#include "miniyaml/project/server_config.hpp"
#include "miniyaml/query/database.hpp"

namespace miniyaml::lsp
{

struct QuerySystemOptions
{
  WorkLimits limits;

  /// Apply `server.log_level` from miniyaml.yaml on Initialize.
  bool apply_config_log_level = true;

  /// Unit the client counts `character` offsets in, until an Initialize
  /// message names another.
  PositionEncoding position_encoding = PositionEncoding::Utf32;

  /// Installed on the database, and so on every snapshot handed to workers.
  query::EventHook event_hook;
};

/// The sink is called from the actor thread and from work-pool threads.
class QuerySystem
{
public:
  explicit QuerySystem(ResponseSink sink, QuerySystemOptions options = {});
  ~QuerySystem();

  QuerySystem(const QuerySystem &) = delete;
  QuerySystem & operator=(const QuerySystem &) = delete;

  /// Queue a message. Safe to call from any thread.
  void post(Message message);

  /// Run the actor loop on a background thread.
  void start();

  /// Finish every queued message, then join the background thread.
  void stop();

  /// Handle everything queued so far on the calling thread, including the
  /// answers to the reads it hands out.
  void process_pending();

  [[nodiscard]] const query::Database & database() const noexcept { return db_; }
  [[nodiscard]] const ServerConfig & config() const noexcept { return config_; }

private:
  struct Envelope
  {
    Message message;
    WorkPool::Clock::time_point received_at;
  };

  class ReplySlot;

  /// A read handed to the pool and not yet known to be answered.
  struct PendingReply
  {
    std::shared_ptr<ReplySlot> slot;
    WorkPool::Clock::time_point deadline;
    Response fallback;
  };

  void run();
  void take_inbox(std::deque<Envelope> & pending);

  /// One batch; see the file comment.
  void on_new_messages(std::deque<Envelope> & pending);

  void apply(Message & message);
  void serve(const Envelope & envelope);
  void publish_diagnostics();

  /// Send the fallback for every pending read past its deadline.
  void expire_replies(WorkPool::Clock::time_point now);

  /// Block until every pending read is answered, by its worker or by its
  /// fallback.
  void await_replies();

  /// Drop pools replaced by Initialize once their jobs are done.
  void release_idle_pools();

  template <typename T>
  void submit_read(
    const char * description, const RequestId & id, WorkPool::Clock::time_point received_at,
    std::function<T()> work, std::function<Response(T)> to_response, T fallback);

  void on_initialize(const Initialize & msg);
  void on_file_opened(const FileOpened & msg);
  void on_file_changed(const FileChanged & msg);
  void on_file_closed(const FileClosed & msg);

  void serve_hover(const HoverRequest & req, WorkPool::Clock::time_point received_at);
  void serve_definition(const DefinitionRequest & req, WorkPool::Clock::time_point received_at);
  void serve_symbols(const DocumentSymbolsRequest & req, WorkPool::Clock::time_point received_at);

  void mark_changed(FileId file_id);
  void send(Response response) const;

  ResponseSink sink_;
  QuerySystemOptions options_;
  PositionEncoding encoding_;
  ServerConfig config_;

  query::Database db_;
  std::unique_ptr<WorkPool> pool_;
  std::vector<std::unique_ptr<WorkPool>> retired_pools_;

  bool needs_diagnostics_ = false;
  std::vector<FileId> changed_files_;
  std::vector<std::string> closed_uris_;
  std::vector<PendingReply> pending_replies_;

  std::mutex inbox_mutex_;
  std::condition_variable inbox_cv_;
  std::deque<Envelope> inbox_;
  bool stopping_ = false;
  std::thread thread_;
};

}  // namespace miniyaml::lsp
