#include <chrono>
#include <iostream>
#include <stdexcept>

#include <ace/OS_NS_unistd.h>
#include <boost/program_options.hpp>

#include "../common/Utility.h"
#include "../common/os/linux.h"
#include "../common/os/pstree.h"
#include "../killtree/Configuration.h"
#include "../killtree/ProcessTreeKiller.h"
#include "../killtree/Signal.h"
#include "../killtree/TerminationStrategy.h"
#include "ArgumentParser.h"

#define PID "pid"
#define SIGNAL "signal"
#define SIGNAL_ARGS "signal,s"
#define ASYNC "async"
#define ASYNC_ARGS "async,a"
#define TIMEOUT "timeout"
#define TIMEOUT_ARGS "timeout,t"
#define CONFIG "config"
#define CONFIG_ARGS "config,c"
#define VERBOSE "verbose"
#define VERBOSE_ARGS "verbose,V"
#define HELP "help"
#define HELP_ARGS "help,h"

#define OTHER_OPTIONS                                                 \
	po::options_description other("Other Options", BOOST_DESC_WIDTH); \
	other.add_options()                                               \
	(VERBOSE_ARGS, "Enable verbose output")                           \
	(HELP_ARGS, "Display command usage and exit")

#define HELP_ARG_CHECK_WITH_RETURN_ZERO                                                                    \
	Utility::setLogLevel(m_commandLineVariables.count(VERBOSE) ? "DEBUG" : Utility::getenv(ENV_KILLTREE_LOG_LEVEL, "INFO")); \
	if (m_commandLineVariables.count(HELP) > 0)                                                            \
	{                                                                                                      \
		std::cout << desc << std::endl;                                                                    \
		return 0;                                                                                          \
	}

// command line help width
static size_t BOOST_DESC_WIDTH = 130;
// interval to report an asynchronous sweep still in progress
static const std::chrono::milliseconds ASYNC_PROGRESS_INTERVAL(500);

ArgumentParser::ArgumentParser(int argc, char *argv[])
	: m_argc(argc), m_argv(argv)
{
}

ArgumentParser::~ArgumentParser()
{
}

void ArgumentParser::initArgs()
{
	po::options_description global("Global options", BOOST_DESC_WIDTH);
	global.add_options()("command", po::value<std::string>(), "Command to execute.")("subargs", po::value<std::vector<std::string>>(), "Arguments for command.");

	po::positional_options_description pos;
	pos.add("command", 1).add("subargs", -1);

	// parse [command] and all other arguments in [subargs]
	auto parsed = po::command_line_parser(m_argc, m_argv).options(global).positional(pos).allow_unregistered().run();
	m_parsedOptions = parsed.options;
	po::store(parsed, m_commandLineVariables);
	po::notify(m_commandLineVariables);
}

int ArgumentParser::parse()
{
	initArgs();
	int result = 0;
	if (m_commandLineVariables.size() == 0)
	{
		printMainHelp();
		return result;
	}

	std::string cmd = m_commandLineVariables["command"].as<std::string>();
	if (cmd == "kill" || cmd == "terminate")
	{
		result = processKill();
	}
	else if (cmd == "tree" || cmd == "pstree")
	{
		result = processTree();
	}
	else if (cmd == "help")
	{
		printMainHelp();
	}
	else
	{
		std::cerr << "Unknown command: " << cmd << std::endl
				  << std::endl;
		printMainHelp();
		result = -1;
	}
	return result;
}

void ArgumentParser::printMainHelp()
{
	std::cout << "killtree - terminate a process and all of its descendants" << std::endl;
	std::cout << "Usage: killtree [COMMAND] [ARG...] [flags]" << std::endl
			  << std::endl;

	std::cout << "Commands:" << std::endl;
	std::cout << "  kill          Terminate a process tree" << std::endl;
	std::cout << "  tree          Display a process tree" << std::endl;
	std::cout << "  version       Display version" << std::endl;
	std::cout << "  help          Display this help" << std::endl;
	std::cout << std::endl;

	std::cout << "Run 'killtree COMMAND --help' for more information on a command." << std::endl;
}

int ArgumentParser::processKill()
{
	const static char fname[] = "ArgumentParser::processKill() ";

	po::options_description desc("Terminate a process and all of its descendants \nUsage: killtree kill <pid> [options]", BOOST_DESC_WIDTH);
	po::options_description operation("Operation Options", BOOST_DESC_WIDTH);
	operation.add_options()
	(PID, po::value<pid_t>(), "Root process id")
	(SIGNAL_ARGS, po::value<std::string>(), "Signal name or number [default: DefaultSignal of configuration]")
	(ASYNC_ARGS, "Sweep on a background thread and wait for it")
	(TIMEOUT_ARGS, po::value<int>(), "Seconds to wait for the root process to exit [default: ExitWaitSeconds of configuration]")
	(CONFIG_ARGS, po::value<std::string>(), "Configuration file [default: <bin>/../killtree.json]");
	OTHER_OPTIONS;
	desc.add(operation).add(other);
	shiftCommandLineArgs(desc);
	HELP_ARG_CHECK_WITH_RETURN_ZERO;

	const auto pid = getTargetPid(desc);
	const auto config = loadConfiguration();
	const int signal = m_commandLineVariables.count(SIGNAL) ? killtree::parseSignal(m_commandLineVariables[SIGNAL].as<std::string>()) : config->getDefaultSignal();

	const int timeout = m_commandLineVariables.count(TIMEOUT) ? m_commandLineVariables[TIMEOUT].as<int>() : config->getExitWaitSeconds();
	if (timeout < 0)
	{
		throw std::invalid_argument(Utility::stringFormat("invalid timeout <%d>", timeout));
	}

	killtree::ProcessTreeKiller killer(config->buildStrategy());
	LOG_DBG << fname << "process tree <" << pid << "> has " << os::descendants(pid).size() << " descendants";
	if (m_commandLineVariables.count(ASYNC))
	{
		auto future = killer.terminateTreeSuspending(pid, signal);
		while (future.wait_for(ASYNC_PROGRESS_INTERVAL) != std::future_status::ready)
		{
			LOG_INF << fname << "waiting for process tree <" << pid << "> sweep";
		}
		future.get();
	}
	else
	{
		killer.terminateTreeBlocking(pid, signal);
	}

	// signals are delivered asynchronously
	if (!os::waitExit(pid, std::chrono::seconds(timeout)))
	{
		std::cout << "Process <" << pid << "> still running " << timeout << " seconds after " << killtree::signalName(signal) << std::endl;
		return -1;
	}
	std::cout << "Process tree <" << pid << "> terminated by " << killtree::signalName(signal) << " using " << killer.strategy()->name() << " strategy" << std::endl;
	return 0;
}

int ArgumentParser::processTree()
{
	po::options_description desc("Display a process and all of its descendants \nUsage: killtree tree <pid> [options]", BOOST_DESC_WIDTH);
	po::options_description operation("Operation Options", BOOST_DESC_WIDTH);
	operation.add_options()
	(PID, po::value<pid_t>(), "Root process id [default: current process]");
	OTHER_OPTIONS;
	desc.add(operation).add(other);
	shiftCommandLineArgs(desc);
	HELP_ARG_CHECK_WITH_RETURN_ZERO;

	const pid_t pid = m_commandLineVariables.count(PID) ? m_commandLineVariables[PID].as<pid_t>() : ACE_OS::getpid();
	const auto tree = os::pstree(pid);
	if (tree == nullptr)
	{
		std::cerr << "No such process <" << pid << ">" << std::endl;
		return -1;
	}
	std::cout << *tree;
	return 0;
}

void ArgumentParser::shiftCommandLineArgs(po::options_description &desc)
{
	m_commandLineVariables.clear();
	std::vector<std::string> opts = po::collect_unrecognized(m_parsedOptions, po::include_positional);
	// remove [command] option and parse all others in m_commandLineVariables
	if (opts.size())
		opts.erase(opts.begin());

	po::positional_options_description pos;
	pos.add(PID, 1);
	po::store(po::command_line_parser(opts).options(desc).positional(pos).run(), m_commandLineVariables);
	po::notify(m_commandLineVariables);
}

std::shared_ptr<killtree::Configuration> ArgumentParser::loadConfiguration()
{
	const auto path = m_commandLineVariables.count(CONFIG) ? m_commandLineVariables[CONFIG].as<std::string>() : std::string();
	auto config = killtree::Configuration::load(path);
	if (!m_commandLineVariables.count(VERBOSE))
	{
		Utility::setLogLevel(config->getLogLevel());
	}
	return config;
}

pid_t ArgumentParser::getTargetPid(const po::options_description &desc)
{
	if (m_commandLineVariables.count(PID) == 0)
	{
		std::cout << desc << std::endl;
		throw std::invalid_argument("process id is required");
	}
	const auto pid = m_commandLineVariables[PID].as<pid_t>();
	if (pid <= 0)
	{
		throw std::invalid_argument(Utility::stringFormat("invalid process id <%d>", pid));
	}
	return pid;
}
