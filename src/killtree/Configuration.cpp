#include <stdexcept>
#include <stdlib.h> // environ
#if !defined(_WIN32)
#include <unistd.h>
extern char **environ; // unistd.h
#endif

#include "../common/Utility.h"
#include "CommandRunner.h"
#include "Configuration.h"
#include "ProcessTable.h"
#include "Signal.h"
#include "SignalSender.h"
#include "TerminationStrategy.h"

namespace killtree
{
	constexpr int DEFAULT_EXIT_WAIT_SECONDS = 5;

	Configuration::Configuration()
		: m_logLevel("INFO"),
		  m_defaultSignal("SIGKILL"),
		  m_processTable(PROCESS_TABLE_COMMAND),
		  m_exitWaitSeconds(DEFAULT_EXIT_WAIT_SECONDS),
		  m_pgrepCommand("pgrep"),
		  m_psCommand("ps"),
		  m_taskkillCommand("taskkill")
	{
	}

	std::shared_ptr<Configuration> Configuration::FromJson(const nlohmann::json &jsonValue, bool applyEnv)
	{
		const static char fname[] = "Configuration::FromJson() ";

		if (!jsonValue.is_object())
		{
			throw std::invalid_argument("configuration must be a json object");
		}

		auto config = std::make_shared<Configuration>();
		try
		{
			// start from the defaults so that environment variables can set any key
			nlohmann::json merged = config->AsJson();
			merged.merge_patch(jsonValue);
			if (applyEnv)
			{
				Configuration::readConfigFromEnv(merged);
			}

			SET_JSON_STR_VALUE(merged, JSON_KEY_LogLevel, config->m_logLevel);
			SET_JSON_STR_VALUE(merged, JSON_KEY_DefaultSignal, config->m_defaultSignal);
			SET_JSON_STR_VALUE(merged, JSON_KEY_ProcessTable, config->m_processTable);
			SET_JSON_INT_VALUE(merged, JSON_KEY_ExitWaitSeconds, config->m_exitWaitSeconds);
			if (HAS_JSON_FIELD(merged, JSON_KEY_Commands))
			{
				const auto &commands = merged.at(JSON_KEY_Commands);
				SET_JSON_STR_VALUE(commands, JSON_KEY_Commands_Pgrep, config->m_pgrepCommand);
				SET_JSON_STR_VALUE(commands, JSON_KEY_Commands_Ps, config->m_psCommand);
				SET_JSON_STR_VALUE(commands, JSON_KEY_Commands_Taskkill, config->m_taskkillCommand);
			}
		}
		catch (const std::exception &e)
		{
			LOG_ERR << fname << "Failed to parse configuration with error <" << e.what() << ">";
			throw std::invalid_argument(std::string("Failed to parse configuration: ") + e.what());
		}

		if (config->m_processTable != PROCESS_TABLE_COMMAND && config->m_processTable != PROCESS_TABLE_PROCFS)
		{
			throw std::invalid_argument(Utility::stringFormat("unknown %s <%s>, expect <%s> or <%s>", JSON_KEY_ProcessTable,
															  config->m_processTable.c_str(), PROCESS_TABLE_COMMAND, PROCESS_TABLE_PROCFS));
		}
		if (config->m_exitWaitSeconds < 0)
		{
			throw std::invalid_argument(Utility::stringFormat("%s <%d> must not be negative", JSON_KEY_ExitWaitSeconds, config->m_exitWaitSeconds));
		}
		// fail early on a bad signal name
		parseSignal(config->m_defaultSignal);
		return config;
	}

	nlohmann::json Configuration::AsJson() const
	{
		nlohmann::json result = nlohmann::json::object();
		result[JSON_KEY_LogLevel] = m_logLevel;
		result[JSON_KEY_DefaultSignal] = m_defaultSignal;
		result[JSON_KEY_ProcessTable] = m_processTable;
		result[JSON_KEY_ExitWaitSeconds] = m_exitWaitSeconds;
		result[JSON_KEY_Commands] = {
			{JSON_KEY_Commands_Pgrep, m_pgrepCommand},
			{JSON_KEY_Commands_Ps, m_psCommand},
			{JSON_KEY_Commands_Taskkill, m_taskkillCommand}};
		return result;
	}

	std::string Configuration::defaultConfigFilePath()
	{
		return (fs::path(Utility::getHomeDir()) / KILLTREE_CONFIG_JSON_FILE).string();
	}

	std::shared_ptr<Configuration> Configuration::load(const std::string &path)
	{
		const static char fname[] = "Configuration::load() ";

		const auto configFile = path.empty() ? defaultConfigFilePath() : path;
		if (!Utility::isFileExist(configFile))
		{
			if (!path.empty())
			{
				throw std::invalid_argument(Utility::stringFormat("configuration file <%s> not found", path.c_str()));
			}
			LOG_DBG << fname << "no configuration file <" << configFile << ">, use defaults";
			return FromJson(nlohmann::json::object());
		}

		const auto content = Utility::readFileCpp(configFile);
		auto jsonValue = nlohmann::json::parse(content, nullptr, false);
		if (jsonValue.is_discarded())
		{
			throw std::invalid_argument(Utility::stringFormat("configuration file <%s> is not valid json", configFile.c_str()));
		}
		LOG_DBG << fname << "loaded configuration file <" << configFile << ">";
		return FromJson(jsonValue);
	}

	std::shared_ptr<TerminationStrategy> Configuration::buildStrategy() const
	{
		const static char fname[] = "Configuration::buildStrategy() ";

		auto runner = std::make_shared<AceCommandRunner>();
#if defined(_WIN32)
		LOG_DBG << fname << "native strategy with <" << m_taskkillCommand << ">";
		return std::make_shared<NativeTreeStrategy>(runner, m_taskkillCommand);
#else
		std::shared_ptr<ProcessTable> table;
		if (m_processTable == PROCESS_TABLE_PROCFS)
		{
			table = std::make_shared<ProcfsProcessTable>();
		}
		else
		{
			table = std::make_shared<CommandProcessTable>(runner, m_pgrepCommand, m_psCommand);
		}
		LOG_DBG << fname << "enumeration strategy with <" << m_processTable << "> process table";
		return std::make_shared<EnumerationStrategy>(table, std::make_shared<OsSignalSender>());
#endif
	}

	const std::string &Configuration::getLogLevel() const
	{
		return m_logLevel;
	}

	int Configuration::getDefaultSignal() const
	{
		return parseSignal(m_defaultSignal);
	}

	const std::string &Configuration::getProcessTable() const
	{
		return m_processTable;
	}

	int Configuration::getExitWaitSeconds() const
	{
		return m_exitWaitSeconds;
	}

	bool Configuration::readConfigFromEnv(nlohmann::json &jsonConfig)
	{
		const static char fname[] = "Configuration::readConfigFromEnv() ";

		// environment "KILLTREE_LogLevel=DEBUG" overrides a top level key
		// environment "KILLTREE_Commands_Pgrep=/usr/bin/pgrep" overrides a nested key
		bool applyConfig = false;
		for (char **var = environ; var != nullptr && *var != nullptr; var++)
		{
			const std::string env = *var;
			const auto pos = env.find('=');
			if (!Utility::startWith(env, ENV_KILLTREE_PREFIX) || pos == std::string::npos)
			{
				continue;
			}

			const auto envKey = env.substr(0, pos);
			const auto envVal = env.substr(pos + 1);
			const auto keys = Utility::splitString(envKey, "_");
			nlohmann::json *json = &jsonConfig;
			for (size_t i = 1; i < keys.size() && json->is_object() && json->contains(keys[i]); i++)
			{
				if (i == (keys.size() - 1))
				{
					if (applyEnvConfig(json->at(keys[i]), envVal))
					{
						applyConfig = true;
						LOG_DBG << fname << "Configuration: " << envKey << " apply environment value: " << envVal;
					}
					else
					{
						LOG_WAR << fname << "Configuration: " << envKey << " apply environment value: " << envVal << " failed";
					}
				}
				else
				{
					// switch to next level
					json = &(json->at(keys[i]));
				}
			}
		}
		return applyConfig;
	}

	bool Configuration::applyEnvConfig(nlohmann::json &jsonValue, const std::string &envValue)
	{
		if (jsonValue.is_string())
		{
			jsonValue = envValue;
			return true;
		}
		else if (jsonValue.is_number() && Utility::isNumber(envValue))
		{
			jsonValue = std::stoi(envValue);
			return true;
		}
		else if (jsonValue.is_boolean())
		{
			jsonValue = Utility::isNumber(envValue) ? (std::stoi(envValue) > 0) : (envValue == "true");
			return true;
		}
		return false;
	}

} // namespace killtree
