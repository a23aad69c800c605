#include "slidr/pace.hh"

#include <algorithm>

namespace Slidr
{

void Pace::add_observation(double seconds)
{
  // also rejects nan
  if (! (seconds > seconds_min))
  {
    seconds = seconds_min;
  }

  if (_n == 0)
  {
    _ema = seconds;
  }
  else
  {
    _ema = alpha * seconds + (1.0 - alpha) * _ema;
  }

  ++_n;
}

double Pace::predict() const
{
  if (_n == 0)
  {
    return seconds_min + seconds_buffer;
  }

  return std::max(seconds_min, _ema + seconds_buffer);
}

bool Pace::should_enable_autoplay() const
{
  return _n >= observations_min;
}

void Pace::reset()
{
  _n = 0;
  _ema = 0.0;
}

} // namespace Slidr
