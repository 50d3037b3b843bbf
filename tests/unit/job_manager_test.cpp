#include "internal/job/job_manager.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/job/job_worker.hpp"
#include "internal/util/errors.hpp"
#include "test_workspace.hpp"

namespace {

using namespace snapshot::manager::v1;
using snapshot::job::JobManager;
using snapshot::job::JobQueue;
using snapshot::job::JobWorker;
using snapshot::job::ScheduleRequest;
using snapshot::model::Track;
using snapshot::testing::Workspace;

constexpr auto kWait = std::chrono::seconds(10);

/*
  Provider that blocks until released, so tests can act on a job while
  it is running.
*/
class GatedProvider final : public snapshot::job::StepProvider {
 public:
  explicit GatedProvider(std::string id) : id_(std::move(id)) {
  }

  const std::string& Id() const override { return id_; }
  StepKind           Kind() const override { return STEP_KIND_POSTCORRECTION; }
  const std::string& Label() const override { return id_; }

  snapshot::model::StepOutput Execute(const snapshot::job::StepContext& context) override {
    {
      std::unique_lock lock(mutex_);
      started_ = true;
      cv_.notify_all();
      cv_.wait(lock, [&] { return released_; });
    }
    context.cancellation->ThrowIfCancelled();

    snapshot::testing::WriteFile(context.output_folder / "0001.txt", "gated");
    snapshot::model::StepOutput output;
    output.files.push_back({"0001", "0001.txt", "text/plain"});
    return output;
  }

  void WaitStarted() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return started_; });
  }

  void Release() {
    std::lock_guard lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  std::string             id_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    started_  = false;
  bool                    released_ = false;
};

class FailingProvider final : public snapshot::job::StepProvider {
 public:
  const std::string& Id() const override { return id_; }
  StepKind           Kind() const override { return STEP_KIND_LAYOUT_RECOGNITION; }
  const std::string& Label() const override { return id_; }

  snapshot::model::StepOutput Execute(const snapshot::job::StepContext& context) override {
    snapshot::testing::WriteFile(context.output_folder / "partial.xml", "<half");
    throw std::runtime_error("segmentation crashed");
  }

 private:
  std::string id_ = "failing";
};

struct Fixture {
  Workspace                                            ws;
  std::shared_ptr<GatedProvider>                       gated;
  std::shared_ptr<snapshot::db::memory::MemoryRepository> repository;
  std::shared_ptr<JobManager>                          jobs;
};

Fixture MakeFixture(const std::string& name, bool start_paused = false) {
  Fixture f;
  f.ws = snapshot::testing::MakeWorkspace(name);
  snapshot::testing::SeedProject(*f.ws.projects, "p1", 2);
  snapshot::testing::CreateSandbox(f.ws, "p1", "s1");

  f.gated = std::make_shared<GatedProvider>("gated");
  f.ws.providers->Register(f.gated);
  f.ws.providers->Register(std::make_shared<FailingProvider>());

  snapshot::runtime::config::SchedulerConfig config;
  config.set_worker_threads(1);
  config.set_start_paused(start_paused);

  f.repository = std::make_shared<snapshot::db::memory::MemoryRepository>();
  f.jobs       = std::make_shared<JobManager>(f.ws.snapshots, f.ws.providers, f.repository, config);
  return f;
}

Caller Executor() {
  Caller caller;
  caller.set_user("alice");
  caller.add_rights(RIGHT_EXECUTE);
  return caller;
}

ScheduleRequest Request(const std::string& provider, const Track& parent = Track::Root()) {
  ScheduleRequest request;
  request.caller     = Executor();
  request.project_id = "p1";
  request.sandbox_id = "s1";
  request.parent     = parent;
  request.workflow.set_provider_id(provider);
  request.workflow.set_label("Step " + provider);
  (*request.workflow.mutable_arguments())["mode"] = "fast";
  return request;
}

// Runs the next queued job on the calling thread.
uint64_t RunNext(JobManager& jobs) {
  const auto id = jobs.Queue()->Dequeue();
  assert(id.has_value());
  jobs.Execute(*id);
  return *id;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

bool StagingIsEmpty(Fixture& f) {
  const auto staging = f.ws.snapshots->SnapshotsRoot("p1", "s1").parent_path() / ".staging";
  return !std::filesystem::exists(staging) || std::filesystem::is_empty(staging);
}

void TestScheduleUnderRootAppendsFirstChild() {
  auto f = MakeFixture("job_schedule_root");

  const auto handle = f.jobs->Schedule(Request("parent-copy"));
  assert(handle.id() == 1);
  assert(handle.state() == JOB_STATE_QUEUED);
  assert(RunNext(*f.jobs) == 1);

  const auto info = f.jobs->Get(1);
  assert(info.state() == JOB_STATE_SUCCEEDED);
  assert(Track::FromProto(info.result_track()) == Track{0});
  assert(info.progress() == 1.0);
  assert(info.user() == "alice");
  assert(info.has_started());
  assert(info.has_finished());

  const auto derived = f.ws.snapshots->GetDerived("p1", "s1", Track::Root());
  assert(derived.size() == 1);
  assert(Track::FromProto(derived[0].track()) == Track{0});
  assert(derived[0].label() == "Step parent-copy");
  assert(derived[0].job_id() == 1);
  assert(derived[0].child_count() == 0);

  const auto files = f.ws.snapshots->FilesForTrack("p1", "s1", Track{0});
  assert(files.files_size() == 2);
  assert(files.files(0).location_path() == "derived/0/sandbox/0001.png");

  const auto synopsis = f.ws.snapshots->MetsSynopsis("p1", "s1");
  assert(synopsis.size() == 2);
  assert(synopsis[1].name() == "parent-copy");
  assert(synopsis[1].parameter() == "mode=fast");

  assert(f.ws.snapshots->GetRecord("p1", "s1", Track{0}).arguments().at("mode") == "fast");
  assert(StagingIsEmpty(f));
}

void TestScheduleRejectsBeforeQueueing() {
  auto f = MakeFixture("job_schedule_rejects");
  snapshot::testing::AppendChild(f.ws, "p1", "s1", Track::Root(), "locked");
  f.ws.snapshots->Lock("p1", "s1", Track{0}, "job-7", "");

  assert(Throws<snapshot::util::BadRequest>([&] { f.jobs->Schedule(Request("no-such-provider")); }));
  assert(Throws<snapshot::util::TrackNotFound>([&] { f.jobs->Schedule(Request("parent-copy", Track{4})); }));
  assert(Throws<snapshot::util::Conflict>([&] { f.jobs->Schedule(Request("parent-copy", Track{0})); }));

  auto reader = Request("parent-copy");
  reader.caller.clear_rights();
  reader.caller.add_rights(RIGHT_READ);
  assert(Throws<snapshot::util::NotAvailable>([&] { f.jobs->Schedule(reader); }));

  f.ws.snapshots->SetSandboxState("p1", "s1", SANDBOX_STATE_PAUSED);
  assert(Throws<snapshot::util::NotAvailable>([&] { f.jobs->Schedule(Request("parent-copy")); }));

  assert(f.jobs->List(JOB_FILTER_ALL).empty());
  assert(f.jobs->Queue()->Size() == 0);
}

void TestSecuredSandboxNeedsSpecialRight() {
  auto f = MakeFixture("job_schedule_secured");
  f.ws.snapshots->SetSandboxState("p1", "s1", SANDBOX_STATE_SECURED);

  assert(Throws<snapshot::util::NotAvailable>([&] { f.jobs->Schedule(Request("parent-copy")); }));

  auto special = Request("parent-copy");
  special.caller.add_rights(RIGHT_SPECIAL);
  assert(f.jobs->Schedule(special).id() == 1);
}

void TestCancelQueuedJob() {
  auto f = MakeFixture("job_cancel_queued", true);

  const auto id = f.jobs->Schedule(Request("parent-copy")).id();
  assert(f.jobs->Cancel(id));
  assert(f.jobs->Get(id).state() == JOB_STATE_CANCELLED);
  assert(f.jobs->Queue()->Size() == 0);
  assert(!f.jobs->Cancel(id));

  // a stale dequeue of a cancelled job does nothing
  f.jobs->Execute(id);
  assert(f.jobs->Get(id).state() == JOB_STATE_CANCELLED);
  assert(f.ws.snapshots->GetDerived("p1", "s1", Track::Root()).empty());

  assert(Throws<snapshot::util::NotFound>([&] { f.jobs->Cancel(99); }));
}

void TestCancelRunningJobAppendsNothing() {
  auto f      = MakeFixture("job_cancel_running");
  auto worker = std::make_shared<JobWorker>(f.jobs->Queue(), f.jobs);
  worker->Start();

  const auto id = f.jobs->Schedule(Request("gated")).id();
  f.gated->WaitStarted();
  assert(f.jobs->Get(id).state() == JOB_STATE_RUNNING);
  assert(f.jobs->List(JOB_FILTER_RUNNING).size() == 1);

  assert(f.jobs->Cancel(id));
  f.gated->Release();
  assert(f.jobs->WaitForJob(id, kWait));
  worker->Stop();

  const auto info = f.jobs->Get(id);
  assert(info.state() == JOB_STATE_CANCELLED);
  assert(info.result_track().indices_size() == 0);
  assert(f.ws.snapshots->GetDerived("p1", "s1", Track::Root()).empty());
  assert(StagingIsEmpty(f));
}

void TestProviderFailureFailsJob() {
  auto f = MakeFixture("job_provider_failure");

  const auto id = f.jobs->Schedule(Request("failing")).id();
  RunNext(*f.jobs);

  const auto info = f.jobs->Get(id);
  assert(info.state() == JOB_STATE_FAILED);
  assert(info.message().find("segmentation crashed") != std::string::npos);
  assert(f.ws.snapshots->GetDerived("p1", "s1", Track::Root()).empty());
  assert(StagingIsEmpty(f));
}

void TestParentRemovedWhileRunning() {
  auto f = MakeFixture("job_parent_removed");
  snapshot::testing::AppendChild(f.ws, "p1", "s1", Track::Root(), "parent");

  auto worker = std::make_shared<JobWorker>(f.jobs->Queue(), f.jobs);
  worker->Start();

  const auto id = f.jobs->Schedule(Request("gated", Track{0})).id();
  f.gated->WaitStarted();
  f.ws.snapshots->Remove("p1", "s1", Track{0});
  f.gated->Release();
  assert(f.jobs->WaitForJob(id, kWait));
  worker->Stop();

  assert(f.jobs->Get(id).state() == JOB_STATE_FAILED);
  assert(f.ws.snapshots->GetDerived("p1", "s1", Track::Root()).empty());
  assert(!std::filesystem::exists(f.ws.snapshots->SnapshotsRoot("p1", "s1") / "derived" / "0"));
  assert(StagingIsEmpty(f));
}

void TestReplacedParentIsNotAppendedTo() {
  auto f = MakeFixture("job_parent_replaced");
  snapshot::testing::AppendChild(f.ws, "p1", "s1", Track::Root(), "old");

  auto worker = std::make_shared<JobWorker>(f.jobs->Queue(), f.jobs);
  worker->Start();

  const auto id = f.jobs->Schedule(Request("gated", Track{0})).id();
  f.gated->WaitStarted();
  f.ws.snapshots->Remove("p1", "s1", Track{0});
  assert(snapshot::testing::AppendChild(f.ws, "p1", "s1", Track::Root(), "unrelated") == Track{0});
  f.gated->Release();
  assert(f.jobs->WaitForJob(id, kWait));
  worker->Stop();

  const auto info = f.jobs->Get(id);
  assert(info.state() == JOB_STATE_FAILED);
  assert(info.message().find("replaced") != std::string::npos);
  assert(info.result_track().indices_size() == 0);
  assert(f.ws.snapshots->Resolve("p1", "s1", Track{0}).label() == "unrelated");
  assert(f.ws.snapshots->GetDerived("p1", "s1", Track{0}).empty());
  assert(StagingIsEmpty(f));
}

void TestQueuedJobUnderReplacedParentFails() {
  auto f = MakeFixture("job_parent_replaced_queued", true);
  snapshot::testing::AppendChild(f.ws, "p1", "s1", Track::Root(), "old");

  const auto id = f.jobs->Schedule(Request("parent-copy", Track{0})).id();
  f.ws.snapshots->Remove("p1", "s1", Track{0});
  snapshot::testing::AppendChild(f.ws, "p1", "s1", Track::Root(), "unrelated");
  RunNext(*f.jobs);

  assert(f.jobs->Get(id).state() == JOB_STATE_FAILED);
  assert(f.ws.snapshots->GetDerived("p1", "s1", Track{0}).empty());
}

void TestCancelBeforePublishWins() {
  auto f      = MakeFixture("job_cancel_before_publish");
  auto worker = std::make_shared<JobWorker>(f.jobs->Queue(), f.jobs);
  worker->Start();

  const auto id = f.jobs->Schedule(Request("gated")).id();
  f.gated->WaitStarted();

  // hold the sandbox so the finished step waits to publish
  auto sandbox = f.ws.sandboxes->Open("p1", "s1");
  {
    std::unique_lock<std::shared_mutex> hold(sandbox->Mutex());
    f.gated->Release();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(f.jobs->Cancel(id));
  }
  assert(f.jobs->WaitForJob(id, kWait));
  worker->Stop();

  assert(f.jobs->Get(id).state() == JOB_STATE_CANCELLED);
  assert(f.ws.snapshots->GetDerived("p1", "s1", Track::Root()).empty());
  assert(StagingIsEmpty(f));
}

void TestCancelIsRefusedWhilePublishing() {
  snapshot::job::CancellationToken token;
  token.BeginPublish();
  assert(!token.Cancel());
  assert(!token.IsCancelled());
  token.EndPublish();

  assert(token.Cancel());
  assert(token.Cancel());
  assert(Throws<snapshot::job::Cancelled>([&] { token.BeginPublish(); }));
  token.EndPublish();
  assert(token.IsCancelled());
}

ScheduleRequest ChainRequest(const std::string& second_provider) {
  auto  request = Request("parent-copy");
  auto* second  = request.workflow.add_next_steps();
  second->set_provider_id(second_provider);
  second->set_label("Second");
  (*second->mutable_arguments())["mode"] = "slow";
  return request;
}

void TestWorkflowStepsChain() {
  auto f = MakeFixture("job_workflow_chain");

  const auto id = f.jobs->Schedule(ChainRequest("parent-copy")).id();
  RunNext(*f.jobs);

  const auto info = f.jobs->Get(id);
  assert(info.state() == JOB_STATE_SUCCEEDED);
  assert(Track::FromProto(info.result_track()) == (Track{0, 0}));
  assert(info.progress() == 1.0);

  const auto first = f.ws.snapshots->GetDerived("p1", "s1", Track::Root());
  assert(first.size() == 1);
  assert(first[0].label() == "Step parent-copy");
  assert(first[0].job_id() == id);

  const auto second = f.ws.snapshots->GetDerived("p1", "s1", Track{0});
  assert(second.size() == 1);
  assert(second[0].label() == "Second");
  assert(second[0].job_id() == id);
  assert(f.ws.snapshots->GetRecord("p1", "s1", (Track{0, 0})).arguments().at("mode") == "slow");
  assert(f.ws.snapshots->GetRecord("p1", "s1", Track{0}).arguments().at("mode") == "fast");
  assert(f.ws.snapshots->FilesForTrack("p1", "s1", (Track{0, 0})).files_size() == 2);

  const auto synopsis = f.ws.snapshots->MetsSynopsis("p1", "s1");
  assert(synopsis.size() == 3);
  assert(synopsis[2].parameter() == "mode=slow");
  assert(StagingIsEmpty(f));
}

void TestWorkflowChainKeepsPublishedStepsOnFailure() {
  auto f = MakeFixture("job_workflow_chain_failure");

  assert(Throws<snapshot::util::BadRequest>([&] { f.jobs->Schedule(ChainRequest("no-such-provider")); }));
  assert(f.jobs->List(JOB_FILTER_ALL).empty());

  const auto id = f.jobs->Schedule(ChainRequest("failing")).id();
  RunNext(*f.jobs);

  const auto info = f.jobs->Get(id);
  assert(info.state() == JOB_STATE_FAILED);
  assert(Track::FromProto(info.result_track()) == Track{0});
  assert(f.ws.snapshots->GetDerived("p1", "s1", Track::Root()).size() == 1);
  assert(f.ws.snapshots->GetDerived("p1", "s1", Track{0}).empty());
  assert(StagingIsEmpty(f));
}

void TestPauseAndReschedule() {
  auto f = MakeFixture("job_pause_reschedule", true);
  assert(f.jobs->IsPaused());

  for (int i = 0; i < 3; ++i) {
    f.jobs->Schedule(Request("parent-copy"));
  }

  f.jobs->Reschedule(3, JobQueue::Position::kFront);
  f.jobs->Reschedule(2, JobQueue::Position::kIndex, 1);

  auto queued = f.jobs->List(JOB_FILTER_QUEUED);
  assert(queued.size() == 3);
  assert(queued[0].id() == 3);
  assert(queued[1].id() == 2);
  assert(queued[2].id() == 1);

  auto worker = std::make_shared<JobWorker>(f.jobs->Queue(), f.jobs);
  worker->Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(f.jobs->Get(3).state() == JOB_STATE_QUEUED);

  f.jobs->Resume();
  for (uint64_t id : {3, 2, 1}) {
    assert(f.jobs->WaitForJob(id, kWait));
  }
  worker->Stop();

  // one worker runs them in queue order
  assert(Track::FromProto(f.jobs->Get(3).result_track()) == Track{0});
  assert(Track::FromProto(f.jobs->Get(2).result_track()) == Track{1});
  assert(Track::FromProto(f.jobs->Get(1).result_track()) == Track{2});
  assert(!f.jobs->Reschedule(1, JobQueue::Position::kBack));
}

void TestRemoveAndExpungeDone() {
  auto f = MakeFixture("job_remove_done");

  const auto done = f.jobs->Schedule(Request("parent-copy")).id();
  RunNext(*f.jobs);
  f.jobs->Pause();
  const auto queued = f.jobs->Schedule(Request("parent-copy")).id();
  const auto failed = f.jobs->Schedule(Request("failing")).id();
  f.jobs->Cancel(failed);

  assert(!f.jobs->RemoveDone(queued));
  assert(f.jobs->RemoveDone(done));
  assert(Throws<snapshot::util::NotFound>([&] { f.jobs->Get(done); }));

  assert(f.jobs->ExpungeDone() == 1);
  assert(f.jobs->List(JOB_FILTER_DONE).empty());
  assert(f.jobs->List(JOB_FILTER_ALL).size() == 1);

  auto tx = f.repository->Begin();
  assert(f.repository->ListJobs(*tx).size() == 1);
}

void TestRecoveryFailsInterruptedJobs() {
  auto f = MakeFixture("job_recovery", true);
  f.jobs->Schedule(Request("parent-copy"));
  f.jobs->Schedule(Request("parent-copy"));
  f.jobs->Cancel(2);

  snapshot::runtime::config::SchedulerConfig config;
  auto restarted = std::make_shared<JobManager>(f.ws.snapshots, f.ws.providers, f.repository, config);

  const auto first = restarted->Get(1);
  assert(first.state() == JOB_STATE_FAILED);
  assert(first.message() == "interrupted");
  assert(restarted->Get(2).state() == JOB_STATE_CANCELLED);
  assert(restarted->Queue()->Size() == 0);

  assert(restarted->Schedule(Request("parent-copy")).id() == 3);
}

} // namespace

int main() {
  TestScheduleUnderRootAppendsFirstChild();
  TestScheduleRejectsBeforeQueueing();
  TestSecuredSandboxNeedsSpecialRight();
  TestCancelQueuedJob();
  TestCancelRunningJobAppendsNothing();
  TestProviderFailureFailsJob();
  TestParentRemovedWhileRunning();
  TestReplacedParentIsNotAppendedTo();
  TestQueuedJobUnderReplacedParentFails();
  TestCancelBeforePublishWins();
  TestCancelIsRefusedWhilePublishing();
  TestWorkflowStepsChain();
  TestWorkflowChainKeepsPublishedStepsOnFailure();
  TestPauseAndReschedule();
  TestRemoveAndExpungeDone();
  TestRecoveryFailsInterruptedJobs();

  std::cout << "snapshot_manager_unit_job_manager: pass\n";
  return 0;
}
