#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "../common/Utility.h"

namespace po = boost::program_options;

namespace killtree
{
	class Configuration;
}

//////////////////////////////////////////////////////////////////////////
// Command Line arguments parse and process
//////////////////////////////////////////////////////////////////////////
class ArgumentParser
{
public:
	explicit ArgumentParser(int argc, char *argv[]);
	virtual ~ArgumentParser();

	int parse();

private:
	void initArgs();
	void printMainHelp();

	int processKill();
	int processTree();

	void shiftCommandLineArgs(po::options_description &desc);
	std::shared_ptr<killtree::Configuration> loadConfiguration();
	pid_t getTargetPid(const po::options_description &desc);

private:
	po::variables_map m_commandLineVariables;
	std::vector<po::option> m_parsedOptions;
	int m_argc;
	char **m_argv;
};
