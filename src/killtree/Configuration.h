// src/killtree/Configuration.h
#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#define JSON_KEY_LogLevel "LogLevel"
#define JSON_KEY_DefaultSignal "DefaultSignal"
#define JSON_KEY_ProcessTable "ProcessTable"
#define JSON_KEY_ExitWaitSeconds "ExitWaitSeconds"
#define JSON_KEY_Commands "Commands"
#define JSON_KEY_Commands_Pgrep "Pgrep"
#define JSON_KEY_Commands_Ps "Ps"
#define JSON_KEY_Commands_Taskkill "Taskkill"

#define PROCESS_TABLE_COMMAND "command"
#define PROCESS_TABLE_PROCFS "procfs"

namespace killtree
{
	class TerminationStrategy;

	//////////////////////////////////////////////////////////////////////////
	/// Settings of the killtree tool, read from killtree.json and
	/// overridden by KILLTREE_<Key>[_<SubKey>] environment variables.
	//////////////////////////////////////////////////////////////////////////
	class Configuration
	{
	public:
		Configuration();

		static std::shared_ptr<Configuration> FromJson(const nlohmann::json &jsonValue, bool applyEnv = true);
		nlohmann::json AsJson() const;

		// Load from path, or from <home>/killtree.json when path is empty.
		// A missing default file yields the default configuration.
		static std::shared_ptr<Configuration> load(const std::string &path);
		static std::string defaultConfigFilePath();

		// Strategy for this host built from the configured tools.
		std::shared_ptr<TerminationStrategy> buildStrategy() const;

		const std::string &getLogLevel() const;
		int getDefaultSignal() const;
		const std::string &getProcessTable() const;
		// How long the CLI waits for the root to disappear after a sweep.
		int getExitWaitSeconds() const;

	private:
		static bool readConfigFromEnv(nlohmann::json &jsonConfig);
		static bool applyEnvConfig(nlohmann::json &jsonValue, const std::string &envValue);

		std::string m_logLevel;
		std::string m_defaultSignal;
		std::string m_processTable;
		int m_exitWaitSeconds;
		std::string m_pgrepCommand;
		std::string m_psCommand;
		std::string m_taskkillCommand;
	};

} // namespace killtree
