// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ScanDriver.hxx"
#include "PartitionCommand.hxx"
#include "PartitionFilter.hxx"
#include "CancellationToken.hxx"
#include "cluster/Cluster.hxx"
#include "cluster/Node.hxx"
#include "cluster/Error.hxx"
#include "thread_pool.hxx"
#include "thread_job.hxx"
#include "util/Exception.hxx"

#include <list>
#include <mutex>

namespace {

/**
 * Collects the first fatal error of a round.
 */
class RoundError {
	std::mutex mutex;
	std::exception_ptr error;

public:
	/**
	 * @return true if this is the first error
	 */
	bool Set(std::exception_ptr e) noexcept {
		const std::scoped_lock lock{mutex};
		if (error)
			return false;

		error = std::move(e);
		return true;
	}

	std::exception_ptr Get() noexcept {
		const std::scoped_lock lock{mutex};
		return error;
	}
};

/**
 * Executes one #NodePartitions unit in a worker thread.
 */
class UnitJob final : public ThreadJob {
	PartitionCommand &command;
	PartitionTracker &tracker;
	NodePartitions &unit;
	CancellationToken &cancel;
	RoundError &round_error;
	const Logger &logger;

	bool started = false;

public:
	UnitJob(PartitionCommand &_command, PartitionTracker &_tracker,
		NodePartitions &_unit, CancellationToken &_cancel,
		RoundError &_round_error, const Logger &_logger) noexcept
		:command(_command), tracker(_tracker), unit(_unit),
		 cancel(_cancel), round_error(_round_error),
		 logger(_logger) {}

	~UnitJob() noexcept = default;

	/**
	 * Has a worker thread picked up this job?  If not, the pool
	 * was stopped before.
	 */
	bool WasStarted() const noexcept {
		return started;
	}

	/* virtual methods from class ThreadJob */
	void Run() noexcept override;

private:
	void Fail(std::exception_ptr e) noexcept {
		if (round_error.Set(std::move(e)))
			/* stop the other units of this round */
			cancel.Cancel();
	}
};

void
UnitJob::Run() noexcept
{
	started = true;

	try {
		cancel.ThrowIfCancelled();
		command.Execute(*unit.node, unit, tracker, cancel);
	} catch (const ClusterError &e) {
		if (!cancel.IsCancelled() && tracker.ShouldRetry(unit, e)) {
			logger.Fmt(5, "Node {} failed, retrying its partitions: {}",
				   unit.node->GetName(), e.what());
			return;
		}

		Fail(std::current_exception());
	} catch (...) {
		Fail(std::current_exception());
	}
}

} // anonymous namespace

ScanDriver::ScanDriver(Cluster &_cluster, const ScanPolicy &policy,
		       std::string_view _ns, PartitionCommand &_command)
	:cluster(_cluster), command(_command), ns(_ns),
	 tracker(policy, cluster.GetSnapshot()->nodes.size()) {}

ScanDriver::ScanDriver(Cluster &_cluster, const ScanPolicy &policy,
		       std::string_view _ns, std::string_view node_name,
		       PartitionCommand &_command)
	:cluster(_cluster), command(_command), ns(_ns),
	 tracker(policy, node_name) {}

ScanDriver::ScanDriver(Cluster &_cluster, const ScanPolicy &policy,
		       std::string_view _ns, PartitionFilter &filter,
		       PartitionCommand &_command)
	:cluster(_cluster), command(_command), ns(_ns),
	 tracker(policy, cluster.GetSnapshot()->nodes.size(), filter) {}

void
ScanDriver::RunRound(std::vector<NodePartitions> &units)
{
	auto &queue = cluster.GetWorkerPool().Get();

	CancellationToken cancel(&cluster.GetCloseToken());
	RoundError round_error;

	std::list<UnitJob> jobs;
	for (auto &unit : units) {
		auto &job = jobs.emplace_back(command, tracker, unit, cancel,
					      round_error, cluster.GetLogger());
		queue.Add(job);
	}

	for (auto &job : jobs) {
		queue.WaitDone(job);

		if (!job.WasStarted())
			round_error.Set(std::make_exception_ptr(ClusterError(ResultCode::SCAN_TERMINATED,
									     "Cluster is closed")));
	}

	if (auto error = round_error.Get()) {
		tracker.PartitionError();
		std::rethrow_exception(error);
	}
}

void
ScanDriver::Run()
{
	const auto &close_token = cluster.GetCloseToken();

	while (true) {
		close_token.ThrowIfCancelled();

		auto &units = tracker.AssignPartitionsToNodes(cluster, ns);
		RunRound(units);

		if (tracker.IsComplete(cluster))
			return;

		const auto sleep = tracker.GetSleepBetweenRetries();
		if (sleep.count() > 0 && !close_token.WaitFor(sleep))
			throw ClusterError(ResultCode::SCAN_TERMINATED,
					   "Cluster is closed");
	}
}

bool
DeliverRecord(const RecordListener &listener, PartitionTracker &tracker,
	      NodePartitions &unit, const CancellationToken &cancel,
	      const Digest &digest, uint64_t bval, std::string_view record)
{
	cancel.ThrowIfCancelled();

	if (!tracker.AllowRecord(unit))
		return false;

	tracker.SetLast(unit, digest, bval);

	if (!listener(*unit.node, digest, record))
		throw ClusterError(ResultCode::SCAN_TERMINATED,
				   "Scan terminated by the record listener");

	return true;
}
