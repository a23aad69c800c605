#ifndef OB_TIMER_HH
#define OB_TIMER_HH

#include <chrono>

namespace OB
{

// monotonic stopwatch
class Timer
{
public:

  using clock = std::chrono::steady_clock;

  Timer() = default;

  Timer& start()
  {
    _is_running = true;
    _start = clock::now();

    return *this;
  }

  Timer& reset()
  {
    _is_running = false;
    _total = {};

    return *this;
  }

  template<typename T>
  T time()
  {
    if (_is_running)
    {
      update();
    }

    return std::chrono::duration_cast<T>(_total);
  }

  // elapsed seconds since the last lap, then restart
  double lap()
  {
    auto const res = time<std::chrono::duration<double>>().count();

    reset();
    start();

    return res;
  }

private:

  void update()
  {
    auto const stop = clock::now();

    if (stop > _start)
    {
      _total += (stop - _start);
    }

    _start = stop;
  }

  bool _is_running {false};
  clock::time_point _start;
  clock::duration _total {};
}; // class Timer

} // namespace OB

#endif // OB_TIMER_HH
