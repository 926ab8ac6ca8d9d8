// src/killtree/CommandRunner.h
#pragma once

#include <string>
#include <vector>

namespace killtree
{
	struct CommandResult
	{
		int exitCode;
		std::string output; // captured stdout
	};

	// Runs an external program to completion.
	class CommandRunner
	{
	public:
		virtual ~CommandRunner() = default;

		// argv[0] is the program, looked up in PATH.
		// Throws std::runtime_error when no process could be created (pipe or
		// fork failure). A program that fails to exec is not an exception on
		// POSIX: the child exits with the exec errno (2 for a missing program)
		// and that shows up in exitCode.
		virtual CommandResult run(const std::vector<std::string> &argv) = 0;
	};

	// CommandRunner backed by ACE_Process with stdout redirected to an ACE_Pipe.
	class AceCommandRunner : public CommandRunner
	{
	public:
		CommandResult run(const std::vector<std::string> &argv) override;
	};

} // namespace killtree
