#include "mdquery_cli/cli_handler.hpp"
#include <cstdlib>
#include <iostream>

namespace
{
  // Usage problems exit 2, runtime failures 1.
  constexpr int kExitFailure = 1;
  constexpr int kExitUsage = 2;

  std::string default_db_path()
  {
    if (const char *db_env = std::getenv("MDQUERY_DB"))
    {
      return db_env;
    }
    return "mdquery.db";
  }
}

int main(int argc, char *argv[])
{
  mdquery_cli::CliHandler handler(default_db_path());

  mdquery_cli::CliOptions options;
  try
  {
    options = handler.parse_arguments(argc, argv);
  }
  catch (const mdquery_cli::CliError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    std::cerr << "Run 'mdquery_cli help' for usage." << std::endl;
    return kExitUsage;
  }

  try
  {
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }

  return 0;
}
