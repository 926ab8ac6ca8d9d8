// test/killtree/main.cpp
#define CATCH_CONFIG_MAIN // This tells Catch to provide a main() - only do this in one cpp file
#include "../../src/common/Utility.h"
#include "../../src/killtree/CommandRunner.h"
#include "../../src/killtree/Configuration.h"
#include "../../src/killtree/ProcessReference.h"
#include "../../src/killtree/ProcessTable.h"
#include "../../src/killtree/ProcessTreeKiller.h"
#include "../../src/killtree/Signal.h"
#include "../../src/killtree/SignalSender.h"
#include "../../src/killtree/TerminationStrategy.h"
#include <ace/Init_ACE.h>
#include <algorithm>
#include <atomic>
#include <catch.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace killtree;

void init()
{
	static bool initialized = false;
	if (!initialized)
	{
		initialized = true;
		ACE::init();
		// Log level
		Utility::setLogLevel("DEBUG");

		LOG_INF << "Logging process ID:" << ACE_OS::getpid();
	}
}

// Process table over a fixed parent -> children map.
class FakeProcessTable : public ProcessTable
{
public:
	std::vector<pid_t> children(pid_t pid) override
	{
		++m_childrenCalls;
		if (m_failing.count(pid))
		{
			throw std::runtime_error("children query failed");
		}
		const auto iter = m_tree.find(pid);
		return iter == m_tree.end() ? std::vector<pid_t>() : iter->second;
	}

	std::vector<pid_t> descendants(pid_t pid) override
	{
		++m_descendantsCalls;
		if (m_failDescendants)
		{
			throw std::runtime_error("descendants query failed");
		}
		return m_flat;
	}

	std::map<pid_t, std::vector<pid_t>> m_tree;
	std::set<pid_t> m_failing;
	std::vector<pid_t> m_flat;
	bool m_failDescendants = false;
	std::atomic<int> m_childrenCalls{0};
	std::atomic<int> m_descendantsCalls{0};
};

// Records every delivery attempt, in order.
class RecordingSignalSender : public SignalSender
{
public:
	void send(pid_t pid, int signal) override
	{
		std::lock_guard<std::mutex> guard(m_mutex);
		const bool alreadyGone = m_failRepeated && m_delivered.count(pid);
		m_sent.emplace_back(pid, signal);
		if (m_refused.count(pid) || alreadyGone)
		{
			throw std::runtime_error("no such process");
		}
		m_delivered.insert(pid);
	}

	std::vector<pid_t> pids()
	{
		std::lock_guard<std::mutex> guard(m_mutex);
		std::vector<pid_t> result;
		for (const auto &entry : m_sent)
		{
			result.push_back(entry.first);
		}
		return result;
	}

	std::vector<std::pair<pid_t, int>> sent()
	{
		std::lock_guard<std::mutex> guard(m_mutex);
		return m_sent;
	}

	std::set<pid_t> m_refused;
	bool m_failRepeated = false;

private:
	std::mutex m_mutex;
	std::vector<std::pair<pid_t, int>> m_sent;
	std::set<pid_t> m_delivered;
};

// Returns canned results keyed by program name.
class FakeCommandRunner : public CommandRunner
{
public:
	CommandResult run(const std::vector<std::string> &argv) override
	{
		m_calls.push_back(argv);
		if (m_fail)
		{
			throw std::runtime_error("failed to start " + argv.front());
		}
		const auto iter = m_results.find(argv.front());
		return iter == m_results.end() ? CommandResult{0, std::string()} : iter->second;
	}

	std::map<std::string, CommandResult> m_results;
	std::vector<std::vector<std::string>> m_calls;
	bool m_fail = false;
};

struct Fixture
{
	Fixture()
		: table(std::make_shared<FakeProcessTable>()),
		  sender(std::make_shared<RecordingSignalSender>()),
		  killer(std::make_shared<EnumerationStrategy>(table, sender))
	{
		init();
		// 100 -> {101, 102}, 101 -> {103}
		table->m_tree[100] = {101, 102};
		table->m_tree[101] = {103};
	}

	std::shared_ptr<FakeProcessTable> table;
	std::shared_ptr<RecordingSignalSender> sender;
	ProcessTreeKiller killer;
};

TEST_CASE("Process reference resolution", "[ProcessReference]")
{
	init();

	REQUIRE(resolvePid(ProcessReference(pid_t(4242))) == std::optional<pid_t>(4242));
	REQUIRE(resolvePid(ProcessReference(pid_t(0))) == std::optional<pid_t>(0));

	ProcessHandle handle;
	handle.pid = 77;
	REQUIRE(resolvePid(handle) == std::optional<pid_t>(77));

	handle.pid.reset();
	REQUIRE_FALSE(resolvePid(handle).has_value());
}

TEST_CASE("Blocking sweep signals leaves before ancestors", "[Blocking]")
{
	Fixture f;

	SECTION("post-order over the whole tree")
	{
		REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(100));
		REQUIRE(f.sender->pids() == std::vector<pid_t>({103, 101, 102, 100}));
		for (const auto &entry : f.sender->sent())
		{
			REQUIRE(entry.second == SIGKILL);
		}
	}

	SECTION("signal is passed through")
	{
		f.killer.terminateTreeBlocking(100, SIGTERM);
		REQUIRE(f.sender->sent().size() == 4);
		for (const auto &entry : f.sender->sent())
		{
			REQUIRE(entry.second == SIGTERM);
		}
	}

	SECTION("handle with a pid is swept like a bare pid")
	{
		int terminateCalls = 0;
		ProcessHandle handle{100, [&terminateCalls](int)
							 { terminateCalls++; }};
		f.killer.terminateTreeBlocking(handle);
		REQUIRE(f.sender->pids() == std::vector<pid_t>({103, 101, 102, 100}));
		REQUIRE(terminateCalls == 0);
	}

	SECTION("leaf process only signals itself")
	{
		f.killer.terminateTreeBlocking(103);
		REQUIRE(f.sender->pids() == std::vector<pid_t>({103}));
	}
}

TEST_CASE("Blocking sweep tolerates failures", "[Blocking]")
{
	Fixture f;

	SECTION("children query failure still signals the node")
	{
		f.table->m_failing.insert(101);
		REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(100));
		// 103 is unreachable once 101 cannot be queried
		REQUIRE(f.sender->pids() == std::vector<pid_t>({101, 102, 100}));
	}

	SECTION("refused signal does not stop the sweep")
	{
		f.sender->m_refused.insert(103);
		f.sender->m_refused.insert(102);
		REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(100));
		REQUIRE(f.sender->pids() == std::vector<pid_t>({103, 101, 102, 100}));
	}

	SECTION("absent process completes without error")
	{
		f.sender->m_refused.insert(999);
		REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(999));
		REQUIRE(f.sender->pids() == std::vector<pid_t>({999}));
	}

	SECTION("second call on a dead tree is harmless")
	{
		f.sender->m_failRepeated = true;
		REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(100));
		REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(100));
		REQUIRE(f.sender->pids().size() == 8);
	}
}

TEST_CASE("Handle without a pid falls back to its own terminate", "[Fallback]")
{
	Fixture f;
	int terminateCalls = 0;
	int terminateSignal = 0;
	ProcessHandle handle{std::nullopt, [&](int signal)
						 {
							 terminateCalls++;
							 terminateSignal = signal;
						 }};

	SECTION("blocking")
	{
		f.killer.terminateTreeBlocking(handle, SIGTERM);
		REQUIRE(terminateCalls == 1);
		REQUIRE(terminateSignal == SIGTERM);
		REQUIRE(f.sender->pids().empty());
		REQUIRE(f.table->m_childrenCalls.load() == 0);
	}

	SECTION("asynchronous")
	{
		auto future = f.killer.terminateTreeSuspending(handle);
		REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
		REQUIRE_NOTHROW(future.get());
		REQUIRE(terminateCalls == 1);
		REQUIRE(terminateSignal == SIGKILL);
		REQUIRE(f.sender->pids().empty());
		REQUIRE(f.table->m_descendantsCalls.load() == 0);
	}

	SECTION("failing terminate is swallowed")
	{
		ProcessHandle failing{std::nullopt, [&](int)
							  {
								  terminateCalls++;
								  throw std::runtime_error("already exited");
							  }};
		REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(failing));
		REQUIRE(terminateCalls == 1);
	}

	SECTION("handle without pid nor capability does nothing")
	{
		REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(ProcessHandle()));
		REQUIRE(f.sender->pids().empty());
	}
}

TEST_CASE("Non-positive bare pid is a no-op", "[Blocking]")
{
	Fixture f;

	REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(pid_t(0)));
	REQUIRE_NOTHROW(f.killer.terminateTreeBlocking(pid_t(-1)));
	auto future = f.killer.terminateTreeSuspending(pid_t(-1));
	REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
	REQUIRE(f.sender->pids().empty());
	REQUIRE(f.table->m_childrenCalls.load() == 0);
	REQUIRE(f.table->m_descendantsCalls.load() == 0);
}

TEST_CASE("Asynchronous sweep signals in reverse listing order", "[Suspending]")
{
	Fixture f;

	SECTION("listing that includes the root")
	{
		f.table->m_flat = {100, 101, 102, 103};
		auto future = f.killer.terminateTreeSuspending(100);
		REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
		REQUIRE_NOTHROW(future.get());
		REQUIRE(f.sender->pids() == std::vector<pid_t>({103, 102, 101, 100}));
	}

	SECTION("listing without the root")
	{
		f.table->m_flat = {101, 102, 103};
		auto future = f.killer.terminateTreeSuspending(100, SIGTERM);
		REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
		REQUIRE(f.sender->pids() == std::vector<pid_t>({103, 102, 101, 100}));
		REQUIRE(f.sender->sent().back().second == SIGTERM);
		REQUIRE(f.table->m_childrenCalls.load() == 0);
	}

	SECTION("listing failure still signals the root")
	{
		f.table->m_failDescendants = true;
		auto future = f.killer.terminateTreeSuspending(100);
		REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
		REQUIRE_NOTHROW(future.get());
		REQUIRE(f.sender->pids() == std::vector<pid_t>({100}));
	}

	SECTION("dropping the future does not cancel the sweep")
	{
		f.table->m_flat = {101, 102, 103};
		f.killer.terminateTreeSuspending(100);
		const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
		while (f.sender->pids().size() < 4 && std::chrono::steady_clock::now() < deadline)
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}
		REQUIRE(f.sender->pids() == std::vector<pid_t>({103, 102, 101, 100}));
	}
}

TEST_CASE("Concurrent sweeps of distinct trees", "[Concurrency]")
{
	Fixture f;
	// second tree 200 -> {201}, 201 -> {202}
	f.table->m_tree[200] = {201};
	f.table->m_tree[201] = {202};

	std::thread first([&f]()
					  { f.killer.terminateTreeBlocking(100); });
	std::thread second([&f]()
					   { f.killer.terminateTreeBlocking(200); });
	first.join();
	second.join();

	auto pids = f.sender->pids();
	REQUIRE(pids.size() == 7);
	REQUIRE(std::set<pid_t>(pids.begin(), pids.end()) == std::set<pid_t>({100, 101, 102, 103, 200, 201, 202}));

	// each tree keeps its own leaves-first order
	auto position = [&pids](pid_t pid)
	{ return std::find(pids.begin(), pids.end(), pid) - pids.begin(); };
	REQUIRE(position(103) < position(101));
	REQUIRE(position(101) < position(100));
	REQUIRE(position(102) < position(100));
	REQUIRE(position(202) < position(201));
	REQUIRE(position(201) < position(200));
}

TEST_CASE("Concurrent sweeps of overlapping trees", "[Concurrency]")
{
	Fixture f;
	// every pid answers only its first signal, later ones fail like a gone process
	f.sender->m_failRepeated = true;
	// listing for the subtree rooted at 101
	f.table->m_flat = {103};

	// Catch assertions stay on the test thread
	std::exception_ptr errors[3];
	auto guarded = [](std::exception_ptr &error, const std::function<void()> &action)
	{
		try
		{
			action();
		}
		catch (...)
		{
			error = std::current_exception();
		}
	};
	std::thread first([&]()
					  { guarded(errors[0], [&f]()
								{ f.killer.terminateTreeBlocking(100); }); });
	std::thread second([&]()
					   { guarded(errors[1], [&f]()
								 { f.killer.terminateTreeSuspending(101).get(); }); });
	std::thread third([&]()
					  { guarded(errors[2], [&f]()
								{ f.killer.terminateTreeBlocking(100); }); });
	first.join();
	second.join();
	third.join();
	for (const auto &error : errors)
	{
		REQUIRE_NOTHROW(error ? std::rethrow_exception(error) : void());
	}

	// two full sweeps of 100 plus {103, 101}, failures included
	auto pids = f.sender->pids();
	REQUIRE(pids.size() == 10);
	REQUIRE(std::set<pid_t>(pids.begin(), pids.end()) == std::set<pid_t>({100, 101, 102, 103}));
	REQUIRE(std::count(pids.begin(), pids.end(), 101) == 3);
	REQUIRE(std::count(pids.begin(), pids.end(), 103) == 3);
	REQUIRE(f.table->m_descendantsCalls.load() == 1);
}

TEST_CASE("Native tree strategy", "[Native]")
{
	init();
	auto runner = std::make_shared<FakeCommandRunner>();
	NativeTreeStrategy strategy(runner);

	SECTION("one taskkill call per tree")
	{
		strategy.terminateTree(4321, SIGKILL);
		REQUIRE(runner->m_calls.size() == 1);
		REQUIRE(runner->m_calls.front() == std::vector<std::string>({"taskkill", "/pid", "4321", "/t", "/f"}));
	}

	SECTION("flat variant issues the same call")
	{
		strategy.terminateTreeFlat(4321, SIGTERM);
		REQUIRE(runner->m_calls.size() == 1);
		REQUIRE(runner->m_calls.front() == std::vector<std::string>({"taskkill", "/pid", "4321", "/t", "/f"}));
	}

	SECTION("utility failures are swallowed")
	{
		runner->m_results["taskkill"] = CommandResult{128, "ERROR: The process \"4321\" not found."};
		REQUIRE_NOTHROW(strategy.terminateTree(4321, SIGKILL));
		runner->m_fail = true;
		REQUIRE_NOTHROW(strategy.terminateTree(4321, SIGKILL));
		REQUIRE(runner->m_calls.size() == 2);
	}

	SECTION("configured utility path")
	{
		ProcessTreeKiller killer(std::make_shared<NativeTreeStrategy>(runner, "C:\\Windows\\System32\\taskkill.exe"));
		killer.terminateTreeBlocking(55);
		REQUIRE(runner->m_calls.front().front() == "C:\\Windows\\System32\\taskkill.exe");
		REQUIRE(runner->m_calls.front()[2] == "55");
	}
}

TEST_CASE("Command process table", "[ProcessTable]")
{
	init();
	auto runner = std::make_shared<FakeCommandRunner>();
	CommandProcessTable table(runner);

	SECTION("pgrep output is parsed line by line")
	{
		runner->m_results["pgrep"] = CommandResult{0, "101\n102\n\n"};
		REQUIRE(table.children(100) == std::vector<pid_t>({101, 102}));
		REQUIRE(runner->m_calls.front() == std::vector<std::string>({"pgrep", "-P", "100"}));
	}

	SECTION("pgrep without match means no children")
	{
		runner->m_results["pgrep"] = CommandResult{1, ""};
		REQUIRE(table.children(100).empty());
	}

	SECTION("pgrep failure is reported")
	{
		runner->m_results["pgrep"] = CommandResult{2, ""};
		REQUIRE_THROWS_AS(table.children(100), std::runtime_error);
		runner->m_fail = true;
		REQUIRE_THROWS(table.children(100));
	}

	SECTION("ps output is walked breadth-first")
	{
		runner->m_results["ps"] = CommandResult{0, "    1     0\n  100     1\n  101   100\n  102   100\n  103   101\n  200     1\n"};
		REQUIRE(table.descendants(100) == std::vector<pid_t>({101, 102, 103}));
		REQUIRE(table.descendants(103).empty());
		REQUIRE(runner->m_calls.front() == std::vector<std::string>({"ps", "-A", "-o", "pid=", "-o", "ppid="}));
	}

	SECTION("ps without the root is reported")
	{
		runner->m_results["ps"] = CommandResult{0, "    1     0\n  200     1\n"};
		REQUIRE_THROWS_WITH(table.descendants(100), Catch::Contains("no matching pid"));
	}

	SECTION("enumeration strategy over the command table")
	{
		runner->m_results["pgrep"] = CommandResult{1, ""};
		auto sender = std::make_shared<RecordingSignalSender>();
		ProcessTreeKiller killer(std::make_shared<EnumerationStrategy>(std::make_shared<CommandProcessTable>(runner), sender));
		killer.terminateTreeBlocking(300);
		REQUIRE(sender->pids() == std::vector<pid_t>({300}));
	}
}

TEST_CASE("Signal names", "[Signal]")
{
	init();

	REQUIRE(parseSignal("KILL") == SIGKILL);
	REQUIRE(parseSignal("SIGKILL") == SIGKILL);
	REQUIRE(parseSignal("sigterm") == SIGTERM);
	REQUIRE(parseSignal(" term ") == SIGTERM);
	REQUIRE(parseSignal("HUP") == SIGHUP);
	REQUIRE(parseSignal("15") == 15);
	REQUIRE_THROWS_AS(parseSignal("FOO"), std::invalid_argument);
	REQUIRE_THROWS_AS(parseSignal("0"), std::invalid_argument);
	REQUIRE_THROWS_AS(parseSignal("-9"), std::invalid_argument);
	REQUIRE_THROWS_AS(parseSignal(""), std::invalid_argument);

	REQUIRE(signalName(SIGKILL) == "SIGKILL");
	REQUIRE(signalName(SIGTERM) == "SIGTERM");
	REQUIRE(signalName(77) == "77");
	REQUIRE(DEFAULT_KILL_SIGNAL == SIGKILL);
}

TEST_CASE("Killer construction", "[ProcessTreeKiller]")
{
	init();

	REQUIRE_THROWS_AS(ProcessTreeKiller(nullptr), std::invalid_argument);
	REQUIRE(ProcessTreeKiller::instance().strategy() != nullptr);
#if defined(_WIN32)
	REQUIRE(std::string(ProcessTreeKiller::instance().strategy()->name()) == "native");
#else
	REQUIRE(std::string(ProcessTreeKiller::instance().strategy()->name()) == "enumeration");
#endif
	REQUIRE(&ProcessTreeKiller::instance() == &ProcessTreeKiller::instance());

	// host strategy and default configuration agree
	const auto host = TerminationStrategy::forHost();
	REQUIRE(host != nullptr);
	REQUIRE(std::string(host->name()) == Configuration().buildStrategy()->name());
	REQUIRE(std::string(host->name()) == ProcessTreeKiller::instance().strategy()->name());
}
