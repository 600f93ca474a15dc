// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Connect to a cluster, keep its partition map up to date and print
 * the cluster status periodically.
 */

#include "CommandLine.hxx"
#include "cluster/Cluster.hxx"
#include "cluster/Config.hxx"
#include "cluster/Stats.hxx"
#include "net/SocketConnector.hxx"
#include "event/Loop.hxx"
#include "event/TimerEvent.hxx"
#include "event/ShutdownListener.hxx"
#include "util/Exception.hxx"

#include <fmt/core.h>

#include <stdlib.h>

static void
PrintStatus(const Cluster &cluster)
{
	const auto stats = cluster.GetStats();

	fmt::print("tend_count={} invalid_node_count={}\n",
		   stats.tend_count, stats.invalid_node_count);

	for (const auto &node : stats.nodes)
		fmt::print("node {} {} active={} in_use={} in_pool={} opened={} closed={} errors={}\n",
			   node.name, node.host, node.active,
			   node.in_use, node.in_pool,
			   node.opened, node.closed, node.error_count);

	const auto snapshot = cluster.GetSnapshot();
	for (const auto &[ns, partitions] : *snapshot->partition_map) {
		unsigned n_masters = 0;
		for (const auto &node : partitions->replicas.front())
			if (node != nullptr)
				++n_masters;

		fmt::print("namespace {} replicas={} cp={} mapped={}/{}\n",
			   ns, partitions->GetReplicaCount(),
			   partitions->cp_mode,
			   n_masters, partitions->GetPartitionCount());
	}

	fflush(stdout);
}

class Instance {
	Cluster &cluster;

	const std::chrono::seconds interval;

	EventLoop event_loop;

	void OnShutdown() noexcept;
	void OnStatusTimer() noexcept;

	ShutdownListener<Instance, &Instance::OnShutdown> shutdown_listener;
	TimerEvent<Instance, &Instance::OnStatusTimer> status_timer;

public:
	Instance(Cluster &_cluster, std::chrono::seconds _interval)
		:cluster(_cluster), interval(_interval),
		 shutdown_listener(event_loop, *this),
		 status_timer(event_loop, *this) {}

	void Run() noexcept {
		shutdown_listener.Enable();
		status_timer.Schedule(interval);
		event_loop.Dispatch();
	}
};

void
Instance::OnShutdown() noexcept
{
	status_timer.Cancel();
	event_loop.Break();
}

void
Instance::OnStatusTimer() noexcept
{
	PrintStatus(cluster);
	status_timer.Schedule(interval);
}

int
main(int argc, char **argv)
try {
	ToolCmdLine cmdline;
	ClusterConfig config;

	ParseCommandLine(cmdline, config, argc, argv);

	config.Check();

	if (cmdline.check)
		return EXIT_SUCCESS;

	SocketConnector connector;
	Cluster cluster(config, connector);

	if (cmdline.once) {
		cluster.WaitTillStabilized();
		PrintStatus(cluster);
		return EXIT_SUCCESS;
	}

	cluster.Start();
	PrintStatus(cluster);

	Instance instance(cluster, cmdline.interval);
	instance.Run();

	cluster.Close();
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
