#include "job_manager.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <map>
#include <vector>

#include "internal/core/access.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/step_kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/tree/snapshot_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace snapshot::job {

using namespace snapshot::manager::v1;
using observability::StringField;
using observability::UIntField;

namespace {

constexpr const char* kInterrupted = "interrupted";

std::string WorkflowToJson(const WorkflowDefinition& workflow) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(workflow, &json);
  if (!status.ok()) {
    throw std::runtime_error("workflow encode failed: " + std::string(status.message()));
  }
  return json;
}

WorkflowDefinition WorkflowFromJson(const std::string& json) {
  WorkflowDefinition workflow;
  if (json.empty()) return workflow;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(json, &workflow, options);
  if (!status.ok()) {
    SNAPSHOT_LOG_WARN("job.workflow_decode_failed", {StringField("error", std::string(status.message()))});
  }
  return workflow;
}

// "key=value" pairs in key order, the METS agent parameter note.
std::string FormatParameter(const google::protobuf::Map<std::string, std::string>& arguments) {
  const std::map<std::string, std::string> sorted(arguments.begin(), arguments.end());

  std::string out;
  for (const auto& [key, value] : sorted) {
    if (!out.empty()) out += ' ';
    out += key + "=" + value;
  }
  return out;
}

// The first step lives in the top-level workflow fields.
std::vector<WorkflowStep> StepsOf(const WorkflowDefinition& workflow) {
  std::vector<WorkflowStep> steps;
  steps.reserve(1 + workflow.next_steps_size());

  auto& first = steps.emplace_back();
  first.set_provider_id(workflow.provider_id());
  first.set_label(workflow.label());
  first.set_description(workflow.description());
  first.mutable_arguments()->insert(workflow.arguments().begin(), workflow.arguments().end());

  steps.insert(steps.end(), workflow.next_steps().begin(), workflow.next_steps().end());
  return steps;
}

const char* OutcomeName(JobState state) {
  switch (state) {
    case JOB_STATE_SUCCEEDED:
      return "succeeded";
    case JOB_STATE_CANCELLED:
      return "cancelled";
    default:
      return "failed";
  }
}

void SetTimestamp(google::protobuf::Timestamp* out, uint64_t ms) {
  if (ms != 0) *out = util::ToProto(util::FromUnixMillis(ms));
}

} // namespace

JobManager::JobManager(std::shared_ptr<core::SnapshotManager> snapshots, std::shared_ptr<ProviderRegistry> providers,
                       std::shared_ptr<db::Repository> repository, const snapshot::runtime::config::SchedulerConfig& config)
    : snapshots_(std::move(snapshots)),
      providers_(std::move(providers)),
      repository_(std::move(repository)),
      queue_(std::make_shared<JobQueue>()) {
  Recover();
  if (config.start_paused()) {
    queue_->Pause();
  }
}

void JobManager::Recover() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListJobs(*tx);
  next_id_     = repository_->MaxJobId(*tx) + 1;

  const auto now         = util::ToUnixMillis(util::Now());
  std::size_t interrupted = 0;
  for (auto& record : records) {
    if (!model::IsTerminal(record.state)) {
      record.state          = JOB_STATE_FAILED;
      record.message        = kInterrupted;
      record.finished_at_ms = now;
      auto result           = repository_->UpdateJob(*tx, record);
      if (!result) {
        throw std::runtime_error("job recovery failed: " + result.message);
      }
      ++interrupted;
    }

    Entry entry;
    entry.workflow = WorkflowFromJson(record.workflow_json);
    entry.progress = record.state == JOB_STATE_SUCCEEDED ? 1.0 : 0.0;
    entry.record   = std::move(record);
    jobs_.emplace(entry.record.id, std::move(entry));
  }
  tx->Commit();

  if (!jobs_.empty()) {
    SNAPSHOT_LOG_INFO("job.recovered", {UIntField("jobs", jobs_.size()), UIntField("interrupted", interrupted), UIntField("next_id", next_id_)});
  }
}

void JobManager::Persist(const db::model::JobRecord& record, bool insert) {
  auto tx     = repository_->Begin();
  auto result = insert ? repository_->InsertJob(*tx, record) : repository_->UpdateJob(*tx, record);
  if (!result) {
    throw std::runtime_error("job " + std::to_string(record.id) + " persist failed: " + result.message);
  }
  tx->Commit();
}

void JobManager::PublishQueueDepth() const {
  observability::Metrics::Instance().SetQueuedJobs(queue_->Size());
}

// ------------------------------------------------------------
// Scheduling
// ------------------------------------------------------------

JobHandle JobManager::Schedule(const ScheduleRequest& request) {
  const auto provider = providers_->Find(request.workflow.provider_id());
  for (const auto& step : request.workflow.next_steps()) {
    providers_->Find(step.provider_id());
  }

  const auto project = snapshots_->GetProject(request.project_id);
  const auto sandbox = snapshots_->GetSandbox(request.project_id, request.sandbox_id);
  core::RequireSchedulable(project, sandbox, core::Rights::Of(request.caller));

  const auto parent_uid = snapshots_->CheckAppendable(request.project_id, request.sandbox_id, request.parent);

  db::model::JobRecord record;
  record.state             = JOB_STATE_QUEUED;
  record.project_id        = request.project_id;
  record.sandbox_id        = request.sandbox_id;
  record.parent_track      = request.parent.ToString();
  record.provider_id       = provider->Id();
  record.short_description = request.short_description.empty() ? request.workflow.label() : request.short_description;
  record.user              = request.caller.user();
  record.workflow_json     = WorkflowToJson(request.workflow);
  record.created_at_ms     = util::ToUnixMillis(util::Now());

  {
    std::lock_guard lock(mutex_);
    record.id = next_id_++;
    Persist(record, true);

    Entry entry;
    entry.record       = record;
    entry.workflow     = request.workflow;
    entry.parent_uid   = parent_uid;
    entry.cancellation = std::make_shared<CancellationToken>();
    jobs_.emplace(record.id, std::move(entry));
  }

  queue_->Enqueue(record.id);
  PublishQueueDepth();

  SNAPSHOT_LOG_INFO("job.scheduled", {UIntField("job", record.id), StringField("project", record.project_id), StringField("sandbox", record.sandbox_id),
                                      StringField("parent", record.parent_track), StringField("provider", record.provider_id)});

  JobHandle handle;
  handle.set_id(record.id);
  handle.set_state(JOB_STATE_QUEUED);
  return handle;
}

bool JobManager::Cancel(uint64_t job_id) {
  std::unique_lock lock(mutex_);
  auto             it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFound("job " + std::to_string(job_id));
  }

  auto& entry = it->second;
  switch (entry.record.state) {
    case JOB_STATE_QUEUED: {
      queue_->Remove(job_id);
      entry.record.state          = JOB_STATE_CANCELLED;
      entry.record.finished_at_ms = util::ToUnixMillis(util::Now());
      Persist(entry.record, false);
      lock.unlock();

      finished_cv_.notify_all();
      PublishQueueDepth();
      SNAPSHOT_LOG_INFO("job.cancelled", {UIntField("job", job_id), StringField("phase", "queued")});
      return true;
    }
    case JOB_STATE_RUNNING:
      // the worker records the outcome once the provider returns
      if (!entry.cancellation->Cancel()) {
        SNAPSHOT_LOG_INFO("job.cancel_refused", {UIntField("job", job_id), StringField("reason", "publishing")});
        return false;
      }
      SNAPSHOT_LOG_INFO("job.cancel_requested", {UIntField("job", job_id)});
      return true;
    default:
      return false;
  }
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

JobInfo JobManager::ToInfo(const Entry& entry) const {
  const auto& r = entry.record;

  JobInfo info;
  info.set_id(r.id);
  info.set_state(r.state);
  info.set_project_id(r.project_id);
  info.set_sandbox_id(r.sandbox_id);
  *info.mutable_parent_track() = model::Track::Parse(r.parent_track).ToProto();
  info.set_provider_id(r.provider_id);
  info.set_short_description(r.short_description);
  if (!r.result_track.empty()) {
    *info.mutable_result_track() = model::Track::Parse(r.result_track).ToProto();
  }
  info.set_message(r.message);
  info.set_progress(entry.progress);
  info.set_user(r.user);
  SetTimestamp(info.mutable_created(), r.created_at_ms);
  SetTimestamp(info.mutable_started(), r.started_at_ms);
  SetTimestamp(info.mutable_finished(), r.finished_at_ms);
  return info;
}

JobInfo JobManager::Get(uint64_t job_id) const {
  std::lock_guard lock(mutex_);
  auto            it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFound("job " + std::to_string(job_id));
  }
  return ToInfo(it->second);
}

std::vector<JobInfo> JobManager::List(JobFilter filter) const {
  std::vector<JobInfo> out;

  // queued jobs are listed in execution order
  if (filter == JOB_FILTER_QUEUED) {
    const auto      pending = queue_->Pending();
    std::lock_guard lock(mutex_);
    for (auto id : pending) {
      auto it = jobs_.find(id);
      if (it != jobs_.end() && it->second.record.state == JOB_STATE_QUEUED) out.push_back(ToInfo(it->second));
    }
    return out;
  }

  std::lock_guard lock(mutex_);
  for (const auto& [id, entry] : jobs_) {
    const auto state = entry.record.state;
    const bool keep  = filter == JOB_FILTER_ALL || (filter == JOB_FILTER_RUNNING && state == JOB_STATE_RUNNING) ||
                      (filter == JOB_FILTER_DONE && model::IsTerminal(state));
    if (keep) out.push_back(ToInfo(entry));
  }
  return out;
}

bool JobManager::WaitForJob(uint64_t job_id, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return finished_cv_.wait_for(lock, timeout, [&] {
    auto it = jobs_.find(job_id);
    return it == jobs_.end() || model::IsTerminal(it->second.record.state);
  });
}

// ------------------------------------------------------------
// Queue control
// ------------------------------------------------------------

void JobManager::Pause() {
  queue_->Pause();
  SNAPSHOT_LOG_INFO("job.scheduler_paused", {UIntField("queued", queue_->Size())});
}

void JobManager::Resume() {
  queue_->Resume();
  SNAPSHOT_LOG_INFO("job.scheduler_resumed", {UIntField("queued", queue_->Size())});
}

bool JobManager::IsPaused() const {
  return queue_->IsPaused();
}

bool JobManager::Reschedule(uint64_t job_id, JobQueue::Position position, std::size_t index) {
  {
    std::lock_guard lock(mutex_);
    auto            it = jobs_.find(job_id);
    if (it == jobs_.end()) {
      throw util::NotFound("job " + std::to_string(job_id));
    }
    if (it->second.record.state != JOB_STATE_QUEUED) return false;
  }
  return queue_->Move(job_id, position, index);
}

bool JobManager::RemoveDone(uint64_t job_id) {
  std::lock_guard lock(mutex_);
  auto            it = jobs_.find(job_id);
  if (it == jobs_.end() || !model::IsTerminal(it->second.record.state)) return false;

  auto tx     = repository_->Begin();
  auto result = repository_->DeleteJob(*tx, job_id);
  if (!result && result.code != db::ErrorCode::NotFound) {
    throw std::runtime_error("job " + std::to_string(job_id) + " delete failed: " + result.message);
  }
  tx->Commit();

  jobs_.erase(it);
  return true;
}

std::size_t JobManager::ExpungeDone() {
  std::lock_guard lock(mutex_);

  auto        tx      = repository_->Begin();
  std::size_t removed = 0;
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    if (!model::IsTerminal(it->second.record.state)) {
      ++it;
      continue;
    }
    auto result = repository_->DeleteJob(*tx, it->first);
    if (!result && result.code != db::ErrorCode::NotFound) {
      throw std::runtime_error("job " + std::to_string(it->first) + " delete failed: " + result.message);
    }
    ++removed;
    ++it;
  }
  tx->Commit();

  // only drop the cache once the deletes are durable
  std::erase_if(jobs_, [](const auto& item) { return model::IsTerminal(item.second.record.state); });

  SNAPSHOT_LOG_INFO("job.expunged", {UIntField("jobs", removed)});
  return removed;
}

// ------------------------------------------------------------
// Execution
// ------------------------------------------------------------

void JobManager::Finish(uint64_t job_id, JobState state, const std::string& message, const std::string& result_track) {
  db::model::JobRecord record;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = jobs_.at(job_id);
    if (!model::CanTransition(entry.record.state, state)) {
      SNAPSHOT_LOG_WARN("job.transition_refused", {UIntField("job", job_id), StringField("from", JobState_Name(entry.record.state)),
                                                   StringField("to", JobState_Name(state))});
      return;
    }

    entry.record.state          = state;
    entry.record.message        = message;
    entry.record.result_track   = result_track;
    entry.record.finished_at_ms = util::ToUnixMillis(util::Now());
    if (state == JOB_STATE_SUCCEEDED) entry.progress = 1.0;

    Persist(entry.record, false);
    record = entry.record;
  }
  finished_cv_.notify_all();

  const double elapsed_ms = static_cast<double>(record.finished_at_ms - record.started_at_ms);
  observability::Metrics::Instance().ObserveJobDurationMs(record.provider_id, OutcomeName(state), elapsed_ms);

  SNAPSHOT_LOG_INFO("job.finished", {UIntField("job", job_id), StringField("state", JobState_Name(state)), StringField("provider", record.provider_id),
                                     StringField("result", result_track), StringField("message", message)});
}

void JobManager::Execute(uint64_t job_id) {
  db::model::JobRecord               record;
  WorkflowDefinition                 workflow;
  std::string                        parent_uid;
  std::shared_ptr<CancellationToken> cancellation;
  {
    std::lock_guard lock(mutex_);
    auto            it = jobs_.find(job_id);
    // cancelled or removed between dequeue and start
    if (it == jobs_.end() || it->second.record.state != JOB_STATE_QUEUED) return;

    auto& entry                = it->second;
    entry.record.state         = JOB_STATE_RUNNING;
    entry.record.started_at_ms = util::ToUnixMillis(util::Now());
    Persist(entry.record, false);

    record       = entry.record;
    workflow     = entry.workflow;
    parent_uid   = entry.parent_uid;
    cancellation = entry.cancellation;
  }
  PublishQueueDepth();

  observability::SpanScope span("job.execute");
  span.SetAttribute("job.id", static_cast<std::int64_t>(job_id));
  span.SetAttribute("job.provider", record.provider_id);

  const auto            steps  = StepsOf(workflow);
  auto                  parent = model::Track::Parse(record.parent_track);
  std::filesystem::path staging;
  std::string           published;

  try {
    const auto project = snapshots_->GetProject(record.project_id);

    for (std::size_t i = 0; i < steps.size(); ++i) {
      const auto& step     = steps[i];
      const auto  provider = providers_->Find(step.provider_id());
      cancellation->ThrowIfCancelled();

      if (snapshots_->GetRecord(record.project_id, record.sandbox_id, parent).uid() != parent_uid) {
        throw util::TrackNotFound("snapshot " + parent.ToString() + " was replaced");
      }

      StepContext context;
      context.project              = project;
      context.parent               = parent;
      context.snapshots_root       = snapshots_->SnapshotsRoot(record.project_id, record.sandbox_id);
      context.parent_output_folder = snapshots_->OutputFolder(record.project_id, record.sandbox_id, parent);
      context.parent_files         = snapshots_->FilesForTrack(record.project_id, record.sandbox_id, parent);
      context.arguments            = {step.arguments().begin(), step.arguments().end()};
      context.cancellation         = cancellation;
      context.progress             = [this, job_id, i, count = steps.size()](double fraction) {
        std::lock_guard lock(mutex_);
        auto            it = jobs_.find(job_id);
        if (it != jobs_.end()) it->second.progress = (static_cast<double>(i) + std::clamp(fraction, 0.0, 1.0)) / static_cast<double>(count);
      };

      staging               = snapshots_->CreateStagingFolder(record.project_id, record.sandbox_id);
      context.output_folder = tree::SnapshotStore::OutputFolderOf(staging);

      auto output = provider->Execute(context);
      cancellation->ThrowIfCancelled();

      core::AppendRequest append;
      append.project_id = record.project_id;
      append.sandbox_id = record.sandbox_id;
      append.parent     = parent;
      append.parent_uid = parent_uid;
      append.record.set_uid(util::ToString(util::GenerateUUID()));
      append.record.set_kind(provider->Kind());
      append.record.set_label(step.label().empty() ? provider->Label() : step.label());
      append.record.set_description(step.description());
      append.record.set_provider_id(provider->Id());
      append.record.set_job_id(job_id);
      append.record.set_user(record.user);
      append.record.mutable_arguments()->insert(step.arguments().begin(), step.arguments().end());
      append.staging_folder = staging;
      append.output         = std::move(output);
      append.processor      = {provider->Id(), std::string(model::StepKindName(provider->Kind())), FormatParameter(step.arguments())};
      append.before_publish = [&cancellation] { cancellation->BeginPublish(); };

      model::Track track;
      try {
        track = snapshots_->Append(append);
      } catch (const std::exception&) {
        cancellation->EndPublish();
        throw;
      }
      staging.clear();
      published = track.ToString();

      // the last step keeps the token claimed until the job is finished
      if (i + 1 < steps.size()) {
        cancellation->EndPublish();
      }
      parent     = track;
      parent_uid = append.record.uid();
    }

    Finish(job_id, JOB_STATE_SUCCEEDED, "", published);
  } catch (const Cancelled&) {
    span.AddEvent("cancelled");
    if (!staging.empty()) snapshots_->DiscardStagingFolder(staging);
    Finish(job_id, JOB_STATE_CANCELLED, "cancelled", published);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    SNAPSHOT_LOG_WARN("job.failed", {UIntField("job", job_id), StringField("provider", record.provider_id), StringField("error", e.what())});
    if (!staging.empty()) snapshots_->DiscardStagingFolder(staging);
    Finish(job_id, JOB_STATE_FAILED, e.what(), published);
  }
}

} // namespace snapshot::job
