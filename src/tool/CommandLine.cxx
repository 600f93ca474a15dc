// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"
#include "cluster/Config.hxx"
#include "cluster/ConfigParser.hxx"
#include "Logger.hxx"
#include "util/Exception.hxx"
#include "util/StringParser.hxx"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <getopt.h>
#include <string.h>
#include <sysexits.h> // for EX_*

static void
PrintUsage()
{
	puts("usage: kvcluster-tend [options]\n\n"
	     "valid options:\n"
	     " -h             help (this text)\n"
	     " --verbose\n"
	     " -v             be more verbose\n"
	     " --quiet\n"
	     " -q             be quiet\n"
	     " --config-file PATH\n"
	     " -f PATH        load this configuration file\n"
	     " --seed HOST[:TLSNAME][:PORT],...\n"
	     " -S HOSTS       add seed hosts\n"
	     " --set NAME=VALUE  tweak a cluster setting\n"
	     " -s NAME=VALUE  \n"
	     " --check        check the configuration and exit\n"
	     " --once         print the cluster status once and exit\n"
	     " --interval SECONDS\n"
	     " -i SECONDS     print the cluster status this often (default 10)\n"
	     "\n"
	     );
}

static void arg_error(const char *argv0, const char *fmt, ...)
	__attribute__ ((noreturn))
	__attribute__((format(printf,2,3)));
static void arg_error(const char *argv0, const char *fmt, ...) {
	if (fmt != nullptr) {
		va_list ap;

		fputs(argv0, stderr);
		fputs(": ", stderr);

		va_start(ap, fmt);
		vfprintf(stderr, fmt, ap);
		va_end(ap);

		putc('\n', stderr);
	}

	fprintf(stderr, "Try '%s --help' for more information.\n",
		argv0);
	exit(EX_USAGE);
}

static void
HandleSet(ClusterConfig &config, const char *argv0, const char *p)
{
	const char *eq = strchr(p, '=');
	if (eq == nullptr)
		arg_error(argv0, "No '=' found in --set argument");

	if (eq == p)
		arg_error(argv0, "No name found in --set argument");

	const std::string_view name(p, eq - p);
	const char *const value = eq + 1;

	try {
		config.HandleSet(name, value);
	} catch (const std::exception &e) {
		arg_error(argv0, "Error while parsing \"--set %.*s\": %s",
			  (int)name.size(), name.data(), e.what());
	}
}

static void
HandleSeed(ClusterConfig &config, const char *argv0, const char *p)
{
	try {
		for (auto &i : ParseHosts(p, DEFAULT_NODE_PORT))
			config.seeds.emplace_back(std::move(i));
	} catch (const std::exception &e) {
		arg_error(argv0, "Error while parsing \"--seed %s\": %s",
			  p, e.what());
	}
}

void
ParseCommandLine(ToolCmdLine &cmdline, ClusterConfig &config,
		 int argc, char **argv)
{
	static const struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"config-file", 1, nullptr, 'f'},
		{"seed", 1, nullptr, 'S'},
		{"set", 1, nullptr, 's'},
		{"check", 0, nullptr, 'C'},
		{"once", 0, nullptr, 'o'},
		{"interval", 1, nullptr, 'i'},
		{nullptr, 0, nullptr, 0}
	};

	unsigned verbose = 1;

	/* applied after the configuration file has been loaded */
	std::vector<const char *> seeds, sets;

	while (true) {
		int option_index = 0;

		int ret = getopt_long(argc, argv, "hvqf:S:s:Coi:",
				      long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(0);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'f':
			cmdline.config_path = optarg;
			break;

		case 'S':
			seeds.push_back(optarg);
			break;

		case 's':
			sets.push_back(optarg);
			break;

		case 'C':
			cmdline.check = true;
			break;

		case 'o':
			cmdline.once = true;
			break;

		case 'i':
			try {
				cmdline.interval = std::chrono::seconds(ParseUnsignedLong(optarg));
			} catch (const std::exception &e) {
				arg_error(argv[0], "Bad interval: %s", e.what());
			}

			if (cmdline.interval.count() == 0)
				arg_error(argv[0], "Interval must be positive");
			break;

		case '?':
			arg_error(argv[0], nullptr);

		default:
			exit(EX_USAGE);
		}
	}

	SetLogLevel(verbose);

	/* check non-option arguments */

	if (optind < argc)
		arg_error(argv[0], "unrecognized argument: %s", argv[optind]);

	if (cmdline.config_path != nullptr)
		LoadConfigFile(config, cmdline.config_path);

	for (const char *i : seeds)
		HandleSeed(config, argv[0], i);

	for (const char *i : sets)
		HandleSet(config, argv[0], i);

	if (config.seeds.empty())
		arg_error(argv[0], "No seeds; use --seed or --config-file");
}
