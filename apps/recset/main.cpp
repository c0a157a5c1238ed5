#include "repl.hpp"
#include "session.hpp"

#include "recset/logging.hpp"
#include "recset/set.hpp"
#include "recset/utilities/execution_timer.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace std {
namespace fs = std::filesystem;
}


static bool
run_script(const std::fs::path &path, session &s)
{
  using namespace rcs;

  std::ifstream infile {path};
  if (not infile)
  {
    error("Could not open input file '{}'", path.c_str());
    return false;
  }

  bool pending = false;
  for (std::string line; std::getline(infile, line);)
    pending = s.feed(line);

  if (pending)
  {
    s.discard();
    error("{}: unexpected end of file inside a command", path.c_str());
    return false;
  }
  return true;
}


static void
read_eval_print_loop(session &s)
{
  init_readline();

  bool pending = false;
  for (std::string line; prompt_line(pending ? "... " : "> ", line);
       line.clear())
    pending = s.feed(line);
  s.discard();
  std::cout << std::endl;

  cleanup_readline();
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace rcs;

  std::string verbosity {loglevel_name(loglevel::info)};
  std::vector<std::string> commands;
  size_t limit = powerset_limit;

  // Define command line options
  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help", "produce help message")
    ("script", po::value<std::fs::path>(), "file with commands to run")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"),
     "verbosity (silent, error, warning, info, debug)")
    ("powerset-limit", po::value<size_t>(&limit),
     "largest set accepted by powerset")
    ("eval,e", po::value<std::vector<std::string>>(&commands),
     "run a command (may be repeated)")
    ("stats", "report execution timings on exit");

  po::positional_options_description posdesc;
  posdesc.add("script", 1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);
  }
  catch (const po::error &e)
  {
    error("{}", e.what());
    std::cerr << desc << std::endl;
    return EXIT_FAILURE;
  }

  // Print help
  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] [script]" << std::endl;
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  // Set global configuration
  try { loglevel = parse_loglevel(verbosity); }
  catch (const std::runtime_error &exn)
  {
    error("{}", exn.what());
    return EXIT_FAILURE;
  }
  powerset_limit = limit;
  debug("powerset limit: {}", powerset_limit);

  session s {std::cout};
  bool ok = true;

  for (const std::string &command : commands)
  {
    if (s.feed(command))
    {
      s.discard();
      error("incomplete command: {}", command);
      ok = false;
    }
  }

  if (varmap.contains("script"))
    ok = run_script(varmap["script"].as<std::fs::path>(), s) and ok;
  else if (commands.empty())
    read_eval_print_loop(s);

  if (varmap.contains("stats"))
  {
    if (not (loglevel >= loglevel::info))
      loglevel = loglevel::info;
    execution_timer::report_global_stats();
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
