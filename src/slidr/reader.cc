#include "slidr/reader.hh"

#include "ob/string.hh"
#include "ob/timer.hh"

#include <ctime>
#include <cstddef>

#include <string>
#include <sstream>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <vector>
#include <chrono>
#include <thread>
#include <algorithm>
#include <regex>
#include <utility>
#include <optional>
#include <stdexcept>

#include <filesystem>
namespace fs = std::filesystem;

namespace Slidr
{

Reader::Reader(std::ostream& out) :
  _out {out}
{
}

Reader& Reader::init(fs::path const& path)
{
  // empty book
  if (path.empty())
  {
    open(Book(), {}, {});

    return *this;
  }

  if (! fs::exists(path))
  {
    throw std::runtime_error("the file does not exist '" + path.string() + "'");
  }

  std::ifstream ifile {path};
  if (! ifile.is_open())
  {
    throw std::runtime_error("could not open the file '" + path.string() + "'");
  }

  auto const name = path.lexically_normal().string();

  Book book;
  if (book.parse(ifile, name))
  {
    open(std::move(book), path, name);
  }
  else
  {
    open(std::move(book), {}, {});
  }

  return *this;
}

Reader& Reader::init(std::istream& input, std::string const& name)
{
  Book book;
  if (book.parse(input, name))
  {
    open(std::move(book), name, name);
  }
  else
  {
    open(std::move(book), {}, {});
  }

  return *this;
}

void Reader::open(Book book, fs::path const& path, std::string const& name)
{
  // settings carry over to the new book
  _session = Session(std::move(book), _session.chunk_config(),
    _session.window_config(), _session.shift_threshold());

  _session.on_position([&](Position const&) {
    _ctx.redraw = true;

    if (_ctx.autosave)
    {
      save_state(false);
    }
  });

  _ctx.file.path = path;
  _ctx.file.name = name;
  _ctx.redraw = true;

  _timer.reset().start();
}

void Reader::base_config(fs::path const& path)
{
  _ctx.base_config = path;
}

void Reader::load_config(fs::path const& path)
{
  // ignore config if path equals "NONE"
  if (path == "NONE")
  {
    return;
  }

  // buffer for error output
  std::ostringstream err;

  if (! path.empty() && fs::exists(path))
  {
    std::ifstream file {path};

    if (file.is_open())
    {
      std::string line;
      std::size_t lnum {0};

      while (std::getline(file, line))
      {
        // increase line number
        ++lnum;

        // trim leading and trailing whitespace
        line = OB::String::trim(line);

        // ignore empty line or comment
        if (line.empty() || OB::String::assert_rx(line, std::regex("^#[^\\r]*$")))
        {
          continue;
        }

        if (auto const res = command(line))
        {
          if (! res.value().first)
          {
            // source:line: level: info
            err << path.string() << ":" << lnum << ": " << res.value().second << "\n";
          }
        }
      }
    }
    else
    {
      err << "error: could not open config file '" << path.string() << "'\n";
    }
  }

  if (! err.str().empty())
  {
    std::cerr << err.str();
  }
}

bool Reader::save_state(bool const verbose)
{
  if (_ctx.base_config.empty())
  {
    if (verbose)
    {
      set_status(false, "error: empty base config directory");
    }

    return false;
  }

  auto const& content_id = _session.book().id();

  if (content_id.empty())
  {
    if (verbose)
    {
      set_status(false, "error: empty content id");
    }

    return false;
  }

  fs::path path {_ctx.base_config / fs::path("state") / fs::path(content_id)};

  std::ofstream file {path, std::ios::trunc};

  if (! file.is_open())
  {
    set_status(false, "error: could not open file '" + path.string() + "'");

    return false;
  }

  // timestamp
  std::time_t t = std::time(0);
  std::tm tm = *std::localtime(&t);

  auto const& pos = _session.position();

  // dump current state to file
  file
  << "# slidr state\n"
  << "# file: " << _ctx.file.path.string() << "\n"
  << "# date: " << std::put_time(&tm, "%FT%TZ\n")
  << "\n"
  << "goto " << pos.chapter_index << " " << pos.word_offset << "\n"
  << "max-words " << _session.max_words() << "\n"
  << std::flush;

  if (! file)
  {
    set_status(false, "error: could not write file '" + path.string() + "'");

    return false;
  }

  if (verbose)
  {
    set_status(true, "saved state");
  }

  return true;
}

bool Reader::load_state()
{
  if (_ctx.base_config.empty())
  {
    return false;
  }

  auto const& content_id = _session.book().id();

  if (content_id.empty())
  {
    return false;
  }

  fs::path path {_ctx.base_config / fs::path("state") / fs::path(content_id)};

  if (! fs::exists(path))
  {
    return false;
  }

  std::ifstream file {path};

  if (! file.is_open())
  {
    std::cerr << "error: could not open state file '" << path.string() << "'\n";

    return false;
  }

  // replaying moves the session, which must not rewrite the file being read
  auto const autosave = _ctx.autosave;
  _ctx.autosave = false;

  std::string line;
  std::size_t lnum {0};

  while (std::getline(file, line))
  {
    ++lnum;

    // ignore empty line or comment
    if (line.empty() || OB::String::assert_rx(line, std::regex("^#[^\\r]*$")))
    {
      continue;
    }

    // a stale position is clamped, a corrupt line is reported and skipped
    if (auto const res = command(line); res && ! res.value().first)
    {
      std::cerr << path.string() << ":" << lnum << ": " << res.value().second << "\n";
    }
  }

  _ctx.autosave = autosave;

  return true;
}

void Reader::run(std::istream& input)
{
  _ctx.is_running = true;
  _ctx.autosave = true;

  draw();
  _timer.reset().start();

  std::string line;

  while (_ctx.is_running)
  {
    _out << ":" << std::flush;

    if (! std::getline(input, line))
    {
      break;
    }

    if (auto const res = command(OB::String::trim(line)))
    {
      set_status(res.value().first, res.value().second);
    }

    if (_ctx.status)
    {
      auto const& [success, msg] = _ctx.status.value();
      (success ? _out : std::cerr) << msg << "\n";
      _ctx.status.reset();
    }

    if (_ctx.redraw && _ctx.is_running)
    {
      draw();
    }
  }

  _ctx.autosave = false;
}

std::optional<std::pair<bool, std::string>> Reader::command(std::string const& input)
{
  // nop
  if (input.empty())
  {
    return {};
  }

  auto const keys = OB::String::split(input, " ");

  if (keys.empty())
  {
    return {};
  }

  // store the matches returned from OB::String::match
  std::optional<std::vector<std::string>> match_opt;

  // quit
  if (keys.size() == 1 && (keys.at(0) == "q" || keys.at(0) == "Q" ||
    keys.at(0) == "quit" || keys.at(0) == "Quit" || keys.at(0) == "exit"))
  {
    _ctx.is_running = false;
    return {};
  }

  // save state
  else if (keys.size() == 1 && keys.at(0) == "w")
  {
    save_state();
  }

  // save state and quit
  else if (keys.size() == 1 && keys.at(0) == "wq")
  {
    save_state();
    _ctx.is_running = false;
    return {};
  }

  // next slide, the time spent on the slide being left is a pace observation
  else if (keys.size() == 1 && (keys.at(0) == "n" || keys.at(0) == "next"))
  {
    if (! _session.next())
    {
      return std::make_pair(true, "end of book");
    }

    _session.observe(_timer.lap());
  }

  // previous slide
  else if (keys.size() == 1 && (keys.at(0) == "p" || keys.at(0) == "prev"))
  {
    if (! _session.prev())
    {
      return std::make_pair(true, "start of book");
    }

    _timer.reset().start();
  }

  // goto absolute position, negative values are clamped
  else if (keys.at(0) == "goto" && (match_opt = OB::String::match(input,
    std::regex("^goto\\s+(-?[0-9]{1,18})(?:\\s+(-?[0-9]{1,18}))?$"))))
  {
    auto const& match = match_opt.value();

    auto const chapter = std::max(0ll, std::stoll(match.at(1)));
    auto const offset = match.at(2).empty() ? 0ll : std::max(0ll, std::stoll(match.at(2)));

    _session.open({static_cast<std::size_t>(chapter), static_cast<std::size_t>(offset)});
    _timer.reset().start();
  }

  // chapter, numbered from 1
  else if (keys.at(0) == "chapter" && (match_opt = OB::String::match(input,
    std::regex("^chapter(?:\\s+([0-9]{1,9}))?$"))))
  {
    auto const match = match_opt.value().at(1);

    if (match.empty())
    {
      if (_session.empty())
      {
        return std::make_pair(true, "chapter 0/0");
      }

      auto const index = _session.position().chapter_index;

      return std::make_pair(true, "chapter " + std::to_string(index + 1) + "/" +
        std::to_string(_session.book().size()) + " '" + _session.book().at(index).title + "'");
    }

    auto const val = std::stoll(match);

    if (val < 1 || static_cast<std::size_t>(val) > _session.book().size())
    {
      return std::make_pair(false, "error: value '" + match + "' is out of range <1-" +
        std::to_string(_session.book().size()) + ">");
    }

    _session.chapter(static_cast<std::size_t>(val - 1));
    _timer.reset().start();
  }

  // whole book progress
  else if (keys.at(0) == "progress" && (match_opt = OB::String::match(input,
    std::regex("^progress(?:\\s+([0-9]{1,3}(?:\\.[0-9]+)?))?$"))))
  {
    auto const match = match_opt.value().at(1);

    if (match.empty())
    {
      std::ostringstream buf;
      buf << "progress " << std::fixed << std::setprecision(2) << _session.progress() << "%";

      return std::make_pair(true, buf.str());
    }

    auto const val = std::stod(match);

    if (val > 100.0)
    {
      return std::make_pair(false, "error: value '" + match + "' is out of range <0-100>");
    }

    _session.seek(val);
    _timer.reset().start();
  }

  // words per slide
  else if (keys.at(0) == "max-words" && (match_opt = OB::String::match(input,
    std::regex("^max-words(?:\\s+(-?[0-9]{1,18}))?$"))))
  {
    auto const match = match_opt.value().at(1);

    if (match.empty())
    {
      return std::make_pair(true, "max-words " + std::to_string(_session.max_words()));
    }

    auto const val = std::stoll(match);

    if (val < 1 || val > 1000)
    {
      return std::make_pair(false, "error: value '" + match + "' is out of range <1-1000>");
    }

    _session.max_words(val);
    _ctx.redraw = true;

    if (_ctx.autosave)
    {
      save_state(false);
    }
  }

  // slides kept before and after the current one
  else if (keys.at(0) == "window" && (match_opt = OB::String::match(input,
    std::regex("^window(?:\\s+([0-9]{1,2})\\s+([0-9]{1,2}))?$"))))
  {
    auto const& match = match_opt.value();

    if (match.at(1).empty())
    {
      auto const& config = _session.window_config();

      return std::make_pair(true, "window " + std::to_string(config.prev_count) +
        " " + std::to_string(config.next_count));
    }

    Window_Config config;
    config.prev_count = std::stoul(match.at(1));
    config.next_count = std::stoul(match.at(2));

    _session.window_config(config);
  }

  // window slide indexes that trigger a recompute
  else if (keys.at(0) == "threshold" && (match_opt = OB::String::match(input,
    std::regex("^threshold(?:\\s+([0-9]{1,2})\\s+([0-9]{1,2}))?$"))))
  {
    auto const& match = match_opt.value();

    if (match.at(1).empty())
    {
      auto const& threshold = _session.shift_threshold();

      return std::make_pair(true, "threshold " + std::to_string(threshold.forward) +
        " " + std::to_string(threshold.backward));
    }

    Shift_Threshold threshold;
    threshold.forward = std::stoul(match.at(1));
    threshold.backward = std::stoul(match.at(2));

    if (threshold.forward <= threshold.backward)
    {
      return std::make_pair(false, "error: forward threshold '" + match.at(1) +
        "' must be greater than backward threshold '" + match.at(2) + "'");
    }

    _session.shift_threshold(threshold);
  }

  // auto-advance setting
  else if (keys.at(0) == "autoplay" && (match_opt = OB::String::match(input,
    std::regex("^autoplay(?:\\s+(on|off))?$"))))
  {
    auto const match = match_opt.value().at(1);

    if (match.empty())
    {
      return std::make_pair(true, std::string("autoplay ") + (_ctx.autoplay ? "on" : "off"));
    }

    _ctx.autoplay = match == "on";
  }

  // auto-advance, '!' skips the observation requirement
  else if (keys.at(0).rfind("play", 0) == 0 && (match_opt = OB::String::match(input,
    std::regex("^play(!)?(?:\\s+([0-9]{1,4}))?$"))))
  {
    auto const& match = match_opt.value();

    if (! _ctx.autoplay)
    {
      return std::make_pair(false, "error: autoplay is off");
    }

    if (match.at(1).empty() && ! _session.autoplay())
    {
      return std::make_pair(false, "error: autoplay needs " +
        std::to_string(Pace::observations_min - _session.pace().count()) +
        " more observations");
    }

    play(match.at(2).empty() ? _ctx.play_count : std::stoul(match.at(2)));
  }

  else if (keys.size() == 1 && keys.at(0) == "pace")
  {
    return std::make_pair(true, pace());
  }

  else if (keys.size() == 1 && keys.at(0) == "info")
  {
    return std::make_pair(true, info());
  }

  // open
  else if (keys.at(0) == "open" && (match_opt = OB::String::match(input,
    std::regex("^open(?:\\s+([^\\r]+))?$"))))
  {
    fs::path const path = std::move(match_opt.value().at(1));

    if (path.empty())
    {
      return std::make_pair(true, "open " + _ctx.file.name);
    }

    try
    {
      init(path);
    }
    catch (std::exception const& e)
    {
      return std::make_pair(false, "error: " + std::string(e.what()));
    }

    load_state();
  }

  // unknown
  else
  {
    return std::make_pair(false, "warning: unknown command '" + input + "'");
  }

  return {};
}

Session const& Reader::session() const
{
  return _session;
}

bool Reader::is_running() const
{
  return _ctx.is_running;
}

void Reader::draw()
{
  _ctx.redraw = false;

  std::ostringstream buf;

  if (_session.empty())
  {
    buf << "[no content]\n";
  }
  else
  {
    auto const& pos = _session.position();
    auto const& chapter = _session.book().at(pos.chapter_index);
    auto const slide = _session.slide();

    buf
    << "\n"
    << "[" << pos.chapter_index + 1 << "/" << _session.book().size() << "] "
    << chapter.title << "  "
    << std::fixed << std::setprecision(1) << _session.progress() << "%\n"
    << "\n"
    << (slide.empty() ? "[empty chapter]" : slide) << "\n";
  }

  _out << buf.str() << std::flush;
}

void Reader::play(std::size_t count)
{
  // auto-advanced slides are not pace observations
  for (std::size_t i = 0; i < count; ++i)
  {
    std::this_thread::sleep_for(std::chrono::duration<double>(_session.predict()));

    if (! _session.next())
    {
      set_status(true, "end of book");

      break;
    }

    draw();
  }

  _timer.reset().start();
}

void Reader::set_status(bool success, std::string const& msg)
{
  _ctx.status = std::make_pair(success, msg);
}

std::string Reader::info() const
{
  if (_session.empty())
  {
    return "no content";
  }

  auto const& pos = _session.position();
  auto const& window = _session.window();

  std::ostringstream buf;

  buf
  << "chapter " << pos.chapter_index + 1 << "/" << _session.book().size() << " "
  << "offset " << pos.word_offset << "/" << _session.book().at(pos.chapter_index).word_count << " "
  << "slide " << (window.empty() ? 0 : window.current_index + 1) << "/" << window.slides.size() << " "
  << "window " << window.start_word_offset << "-" << window.end_word_offset << " "
  << "max-words " << _session.max_words() << " "
  << std::fixed << std::setprecision(2) << _session.progress() << "%";

  return buf.str();
}

std::string Reader::pace() const
{
  auto const& pace = _session.pace();

  std::ostringstream buf;

  buf
  << std::fixed << std::setprecision(1)
  << "pace " << _session.predict() << "s "
  << "avg " << pace.ema() << "s "
  << "n " << pace.count() << "/" << Pace::observations_min << " "
  << "autoplay " << (_session.autoplay() ? "ready" : "waiting");

  return buf.str();
}

} // namespace Slidr
