#include "slidr/reader.hh"

#include <fcntl.h>
#include <unistd.h>

#include <cstdlib>
#include <cstddef>

#include <string>
#include <vector>
#include <sstream>
#include <iostream>
#include <stdexcept>

#include <filesystem>
namespace fs = std::filesystem;

struct Options
{
  fs::path file;
  fs::path config;
  fs::path config_base;
  std::string max_words;
};

// prototypes
int program_options(Options& opts, int argc, char* argv[]);
std::string program_help();
std::string env_var(std::string const& name);

std::string program_help()
{
  std::ostringstream buf;

  buf
  << "slidr\n"
  << "  Read long text as a sequence of short slides.\n"
  << "\n"
  << "Usage:\n"
  << "  slidr [--config-base <dir>] [--config|-u <file>] [--max-words|-m <n>] [<file>]\n"
  << "  slidr [--help|-h]\n"
  << "  slidr [--version|-v]\n"
  << "\n"
  << "Options:\n"
  << "  --config, -u <file>\n"
  << "    Use the commands in the config file 'file' for initialization.\n"
  << "    To skip the config file, use the special name 'NONE'.\n"
  << "  --config-base <dir>\n"
  << "    Use 'dir' as the base config directory.\n"
  << "    To skip all initializations, use the special name 'NONE'.\n"
  << "  --max-words, -m <n>\n"
  << "    Set the maximum number of words per slide <1-1000>.\n"
  << "  --help, -h\n"
  << "    Print the help output.\n"
  << "  --version, -v\n"
  << "    Print the program version.\n"
  << "\n"
  << "Commands:\n"
  << "  n|next\n    goto next slide\n"
  << "  p|prev\n    goto previous slide\n"
  << "  chapter [<1-n>]\n    show or goto chapter\n"
  << "  goto <chapter-index> [<word-offset>]\n    goto absolute position, chapter index starts at 0\n"
  << "  progress [<0-100>]\n    show or goto whole book percentage\n"
  << "  max-words [<1-1000>]\n    show or set maximum words per slide\n"
  << "  window [<prev> <next>]\n    show or set slides kept around the current slide\n"
  << "  threshold [<forward> <backward>]\n    show or set window recompute thresholds\n"
  << "  pace\n    show the predicted time per slide\n"
  << "  autoplay [on|off]\n    show or set whether auto-advance is allowed\n"
  << "  play[!] [<count>]\n    auto-advance 'count' slides, '!' skips the warm up\n"
  << "  info\n    show the current position\n"
  << "  open <path>\n    open file for reading\n"
  << "  w\n    save state\n"
  << "  wq\n    save state and quit the program\n"
  << "  q|quit|exit\n    quit the program\n"
  << "\n"
  << "Configuration:\n"
  << "  Base Config Directory (BASE): '${HOME}/.slidr'\n"
  << "  State Directory: 'BASE/state'\n"
  << "  Config File: 'BASE/config'\n"
  << "  State Files: 'BASE/state/<content-id>'\n"
  << "\n"
  << "  The config file is a plain text file containing commands,\n"
  << "  one per line. Lines that begin with '#' are comments.\n"
  << "\n"
  << "Examples:\n"
  << "  slidr <file>\n"
  << "  cat <file> | slidr\n"
  << "  slidr --max-words 30 <file>\n"
  << "  slidr --config-base \"~/.config/slidr\" <file>\n"
  << "\n"
  << "Exit Codes:\n"
  << "  0 -> normal\n"
  << "  1 -> error\n";

  return buf.str();
}

std::string env_var(std::string const& name)
{
  if (char const* const val = std::getenv(name.c_str()))
  {
    return val;
  }

  return {};
}

int program_options(Options& opts, int argc, char* argv[])
{
  std::vector<std::string> const args (argv + 1, argv + argc);
  std::vector<std::string> pos;

  for (std::size_t i = 0; i < args.size(); ++i)
  {
    auto const& arg = args.at(i);

    auto const value = [&](std::string& dst) {
      if (i + 1 >= args.size())
      {
        throw std::runtime_error("missing value after '" + arg + "'");
      }

      dst = args.at(++i);
    };

    if (arg == "--help" || arg == "-h")
    {
      std::cout << program_help();

      return 1;
    }
    else if (arg == "--version" || arg == "-v")
    {
      std::cout << "slidr v0.1.0\n";

      return 1;
    }
    else if (arg == "--config" || arg == "-u")
    {
      std::string val;
      value(val);
      opts.config = val;
    }
    else if (arg == "--config-base")
    {
      std::string val;
      value(val);
      opts.config_base = val;
    }
    else if (arg == "--max-words" || arg == "-m")
    {
      value(opts.max_words);
    }
    else if (arg.size() > 1 && arg.front() == '-')
    {
      throw std::runtime_error("unknown flag '" + arg + "'");
    }
    else
    {
      pos.emplace_back(arg);
    }
  }

  if (pos.size() > 1)
  {
    throw std::runtime_error("expected at most one file");
  }

  if (! pos.empty())
  {
    opts.file = pos.front();
  }

  return 0;
}

int main(int argc, char *argv[])
{
  Options opts;

  try
  {
    int pstatus {program_options(opts, argc, argv)};
    if (pstatus > 0) return 0;
  }
  catch (std::exception const& e)
  {
    std::cerr << "Usage:\n  slidr [--config-base <dir>] [--config|-u <file>] [--max-words|-m <n>] [<file>]\n";
    std::cerr << "Error: " << e.what() << "\n";

    return 1;
  }

  std::ios_base::sync_with_stdio(false);

  try
  {
    Slidr::Reader reader;

    if (! opts.file.empty())
    {
      // read from file
      reader.init(opts.file);
    }
    else if (! isatty(STDIN_FILENO))
    {
      // read from stdin
      reader.init(std::cin, "*stdin*");

      // commands come from the terminal
      int tty = open("/dev/tty", O_RDONLY);

      if (tty < 0)
      {
        throw std::runtime_error("could not open '/dev/tty' for input");
      }

      dup2(tty, STDIN_FILENO);
      close(tty);
      std::cin.clear();
    }
    else
    {
      // default
      reader.init();
    }

    // load files
    {
      // determine base config directory
      // default to '~/.slidr'
      fs::path base_config_dir {! opts.config_base.empty() ?
        opts.config_base : fs::path(env_var("HOME") + "/.slidr")};

      if (base_config_dir != "NONE" &&
        fs::exists(base_config_dir) && fs::is_directory(base_config_dir))
      {
        // set base config directory
        reader.base_config(base_config_dir);

        // check/create default directories
        fs::path state_dir {base_config_dir / fs::path("state")};

        if (! fs::exists(state_dir) || ! fs::is_directory(state_dir))
        {
          fs::create_directory(state_dir);
        }

        // load config file
        reader.load_config(! opts.config.empty() ? opts.config :
          base_config_dir / fs::path("config"));

        // load content state if available
        reader.load_state();
      }
      else if (! opts.config.empty())
      {
        reader.load_config(opts.config);
      }
    }

    // command line value wins over config and state
    if (! opts.max_words.empty())
    {
      if (auto const res = reader.command("max-words " + opts.max_words);
        res && ! res.value().first)
      {
        throw std::runtime_error(res.value().second);
      }
    }

    // start event loop
    reader.run(std::cin);
  }
  catch(std::exception const& e)
  {
    std::cerr << "Error: " << e.what() << "\n";

    return 1;
  }

  return 0;
}
