#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/scheduler/delayed_job_worker.hpp"
#include "tests/support/checkout_fixture.hpp"

namespace {

using checkout::db::model::DelayedJobRecord;
using checkout::scheduler::CancellationScheduler;
using checkout::scheduler::DelayedJobWorker;
using checkout::scheduler::DelayedJobWorkerOptions;
using namespace std::chrono_literals;

const checkout::util::TimePoint kT0 = checkout::util::FromUnixMillis(1'700'000'000'000);

void PutJob(checkout::db::Repository& repo, const std::string& id, const std::string& type, checkout::util::TimePoint run_at) {
  DelayedJobRecord job;
  job.id            = id;
  job.type          = type;
  job.payload       = "{}";
  job.run_at_ms     = checkout::util::ToUnixMillis(run_at);
  job.created_at_ms = checkout::util::ToUnixMillis(kT0);

  auto tx = repo.Begin();
  const auto upserted = repo.UpsertDelayedJob(*tx, job);
  assert(upserted);
  tx->Commit();
}

std::optional<DelayedJobRecord> GetJob(checkout::db::Repository& repo, const std::string& id) {
  auto tx  = repo.Begin();
  auto job = repo.GetDelayedJob(*tx, id);
  tx->Commit();
  return job;
}

void TestDueJobsRunAndAreDeleted() {
  auto             repo = std::make_shared<checkout::db::memory::MemoryRepository>();
  DelayedJobWorker worker(repo);

  std::vector<std::string> ran;
  worker.RegisterHandler("echo", [&](const DelayedJobRecord& job) { ran.push_back(job.id); });

  PutJob(*repo, "b", "echo", kT0 - 1s);
  PutJob(*repo, "a", "echo", kT0 - 2s);
  PutJob(*repo, "later", "echo", kT0 + 1h);

  assert(worker.RunOnce(kT0) == 2);
  assert(ran.size() == 2);
  assert(ran[0] == "a");
  assert(ran[1] == "b");
  assert(!GetJob(*repo, "a").has_value());
  assert(!GetJob(*repo, "b").has_value());
  assert(GetJob(*repo, "later").has_value());
}

void TestFailedJobsBackOffThenDrop() {
  auto                    repo = std::make_shared<checkout::db::memory::MemoryRepository>();
  DelayedJobWorkerOptions options;
  options.max_attempts  = 3;
  options.retry_backoff = 10s;
  DelayedJobWorker worker(repo, options);

  int calls = 0;
  worker.RegisterHandler("flaky", [&](const DelayedJobRecord&) {
    ++calls;
    throw std::runtime_error("downstream unavailable");
  });

  PutJob(*repo, "job", "flaky", kT0);

  assert(worker.RunOnce(kT0) == 0);
  auto job = GetJob(*repo, "job");
  assert(job->attempts == 1);
  assert(job->run_at_ms == checkout::util::ToUnixMillis(kT0 + 10s));

  // not due yet
  assert(worker.RunOnce(kT0 + 5s) == 0);
  assert(calls == 1);

  const auto t1 = kT0 + 10s;
  worker.RunOnce(t1);
  job = GetJob(*repo, "job");
  assert(job->attempts == 2);
  assert(job->run_at_ms == checkout::util::ToUnixMillis(t1 + 20s));

  worker.RunOnce(t1 + 20s);
  assert(calls == 3);
  assert(!GetJob(*repo, "job").has_value());
}

void TestUnknownTypeIsDropped() {
  auto             repo = std::make_shared<checkout::db::memory::MemoryRepository>();
  DelayedJobWorker worker(repo);

  PutJob(*repo, "orphan", "nobody-handles-this", kT0);
  assert(worker.RunOnce(kT0) == 0);
  assert(!GetJob(*repo, "orphan").has_value());
}

void TestBatchSizeLimitsOnePoll() {
  auto                    repo = std::make_shared<checkout::db::memory::MemoryRepository>();
  DelayedJobWorkerOptions options;
  options.batch_size = 2;
  DelayedJobWorker worker(repo, options);
  worker.RegisterHandler("echo", [](const DelayedJobRecord&) {});

  for (int i = 0; i < 5; ++i) {
    PutJob(*repo, "job-" + std::to_string(i), "echo", kT0 - std::chrono::seconds(10 - i));
  }

  assert(worker.RunOnce(kT0) == 2);
  assert(worker.RunOnce(kT0) == 2);
  assert(worker.RunOnce(kT0) == 1);
  assert(worker.RunOnce(kT0) == 0);
}

void TestBackgroundThreadFiresDueJobs() {
  auto                    repo = std::make_shared<checkout::db::memory::MemoryRepository>();
  DelayedJobWorkerOptions options;
  options.poll_interval = 10ms;
  DelayedJobWorker worker(repo, options);

  std::atomic<int> ran{0};
  worker.RegisterHandler("echo", [&](const DelayedJobRecord&) { ran++; });
  PutJob(*repo, "now", "echo", checkout::util::Now() - 1s);

  worker.Start();
  for (int i = 0; i < 200 && ran == 0; ++i) std::this_thread::sleep_for(10ms);
  worker.Stop();

  assert(ran == 1);
  assert(!GetJob(*repo, "now").has_value());
}

void TestCancellationJobExpiresUnpaidCheckout() {
  checkout::testing::CheckoutFixture f;
  const auto sku    = f.AddSku(f.AddProduct("Lamp"), 3, 25'000, 5);
  const auto result = f.orchestrator->Checkout(11, {f.Group(3, {f.AddCartItem(11, sku, 5)})});
  assert(f.Sku(sku).stock == 0);

  DelayedJobWorker worker(f.repository);
  auto             settlement = f.settlement;
  worker.RegisterHandler(CancellationScheduler::kJobType, [settlement](const DelayedJobRecord& job) {
    settlement->Expire(CancellationScheduler::DecodePaymentId(job.payload));
  });

  // an hour in, nothing is due
  assert(worker.RunOnce(checkout::util::Now() + 1h) == 0);
  assert(f.Sku(sku).stock == 0);

  assert(worker.RunOnce(checkout::util::Now() + 25h) == 1);
  assert(f.Sku(sku).stock == 5);
  assert(f.Payment(result.payment_id)->status == checkout::model::PaymentStatus::kFailed);
  assert(f.Order(result.orders[0].id)->status == checkout::model::OrderStatus::kCancelled);
  assert(!f.CancelJob(result.payment_id).has_value());
}

void TestRescheduleReplacesPendingJob() {
  checkout::testing::CheckoutFixture f;

  auto tx = f.repository->Begin();
  f.cancellations->Schedule(*tx, 77);
  f.cancellations->Schedule(*tx, 77);
  const auto due = f.repository->ListDueDelayedJobs(*tx, checkout::util::ToUnixMillis(checkout::util::Now() + 48h), 100);
  tx->Commit();

  assert(due.size() == 1);
  assert(due[0].id == "cancel-payment-77");
  assert(CancellationScheduler::DecodePaymentId(due[0].payload) == 77);
  assert(due[0].payload.find("\"jobId\":\"cancel-payment-77\"") != std::string::npos);

  // cancelling a job that is not there is not an error
  auto tx2 = f.repository->Begin();
  f.cancellations->Cancel(*tx2, 77);
  f.cancellations->Cancel(*tx2, 77);
  tx2->Commit();
  assert(!f.CancelJob(77).has_value());
}

void TestMalformedPayloadIsRejected() {
  bool threw = false;
  try {
    (void)CancellationScheduler::DecodePaymentId("{\"data\":{}}");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestPayloadCarriesNumericFields() {
  assert(CancellationScheduler::EncodePayload(42) ==
         R"({"jobId":"cancel-payment-42","delayMs":86400000,"data":{"paymentId":42}})");
  assert(CancellationScheduler::DecodePaymentId(R"({"data":{"paymentId":42}})") == 42);

  bool threw = false;
  try {
    (void)CancellationScheduler::EncodePayload(int64_t{1} << 40);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    CancellationScheduler too_long(std::make_shared<checkout::db::memory::MemoryRepository>(), std::chrono::hours(24 * 30));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDueJobsRunAndAreDeleted();
  TestFailedJobsBackOffThenDrop();
  TestUnknownTypeIsDropped();
  TestBatchSizeLimitsOnePoll();
  TestBackgroundThreadFiresDueJobs();
  TestCancellationJobExpiresUnpaidCheckout();
  TestRescheduleReplacesPendingJob();
  TestMalformedPayloadIsRejected();
  TestPayloadCarriesNumericFields();

  std::cout << "checkout_manager_unit_delayed_job_worker: pass\n";
  return 0;
}
