#include <iostream>
#include <string>

#include <ace/Init_ACE.h>

#include "../common/Utility.h"
#include "ArgumentParser.h"

int main(int argc, char *argv[])
{
	PRINT_VERSION();
	ACE::init();
	int result = -1;
	try
	{
		Utility::initLogging(std::string());
		ArgumentParser parser(argc, argv);
		result = parser.parse();
	}
	catch (const std::exception &e)
	{
		std::cerr << e.what() << std::endl;
		result = -1;
	}
	ACE::fini();
	return result;
}
