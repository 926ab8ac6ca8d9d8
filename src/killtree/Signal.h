// src/killtree/Signal.h
#pragma once

#include <csignal>
#include <string>

#if defined(_WIN32)
// Signal numbers are only meaningful to the POSIX sweep, Windows terminates unconditionally.
#ifndef SIGKILL
#define SIGKILL 9
#endif
#ifndef SIGHUP
#define SIGHUP 1
#endif
#ifndef SIGQUIT
#define SIGQUIT 3
#endif
#ifndef SIGUSR1
#define SIGUSR1 10
#endif
#ifndef SIGUSR2
#define SIGUSR2 12
#endif
#endif

namespace killtree
{
	constexpr int DEFAULT_KILL_SIGNAL = SIGKILL;

	// Parse "KILL", "SIGTERM", "term" or "15" to a signal number.
	// Throws std::invalid_argument for anything else.
	int parseSignal(const std::string &signal);

	// "SIGKILL" for 9, the number itself for unknown signals.
	std::string signalName(int signal);

} // namespace killtree
