#ifndef SLIDR_READER_HH
#define SLIDR_READER_HH

#include "slidr/session.hh"

#include "ob/timer.hh"

#include <cstddef>

#include <string>
#include <iostream>
#include <utility>
#include <optional>

#include <filesystem>
namespace fs = std::filesystem;

namespace Slidr
{

// line based terminal front end driving a reading session
class Reader
{
public:

  Reader(std::ostream& out = std::cout);

  Reader& init(fs::path const& path = {});
  Reader& init(std::istream& input, std::string const& name);
  void base_config(fs::path const& path);
  void load_config(fs::path const& path);
  bool save_state(bool const verbose = true);
  bool load_state();
  void run(std::istream& input);

  // execute one command line
  // returns a status pair of success and message when there is one to show
  std::optional<std::pair<bool, std::string>> command(std::string const& input);

  Session const& session() const;

  bool is_running() const;

private:

  void open(Book book, fs::path const& path, std::string const& name);

  void draw();
  void play(std::size_t count);

  void set_status(bool success, std::string const& msg);

  std::string info() const;
  std::string pace() const;

  std::ostream& _out;

  Session _session;

  // time spent on the current slide
  OB::Timer _timer;

  struct Ctx
  {
    struct File
    {
      // file to read from
      fs::path path;

      // file name
      std::string name;
    } file;

    // base config directory
    fs::path base_config;

    // control when to exit the event loop
    bool is_running {true};

    // persist the position after every change
    bool autosave {false};

    // user setting, auto-advance allowed at all
    bool autoplay {true};

    // slides auto-advanced by 'play' without a count
    std::size_t play_count {10};

    // position changed since the last draw
    bool redraw {false};

    // pending status message and whether it reports success
    std::optional<std::pair<bool, std::string>> status;
  } _ctx;
};

} // namespace Slidr

#endif // SLIDR_READER_HH
