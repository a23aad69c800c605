#ifndef SLIDR_PACE_HH
#define SLIDR_PACE_HH

#include <cstddef>

namespace Slidr
{

// online estimate of per-slide dwell time, an exponential moving average
// of observed seconds, session scoped
class Pace
{
public:

  // weight of the newest observation
  static double constexpr alpha {0.3};

  // observations needed before autoplay is trusted
  static std::size_t constexpr observations_min {5};

  // floor applied to observations and predictions, in seconds
  static double constexpr seconds_min {5.0};

  // added to the average so auto-advance never fires early
  static double constexpr seconds_buffer {2.0};

  Pace() = default;

  void add_observation(double seconds);

  // predicted dwell time in seconds for the next slide
  double predict() const;

  bool should_enable_autoplay() const;

  void reset();

  std::size_t count() const
  {
    return _n;
  }

  double ema() const
  {
    return _ema;
  }

private:

  std::size_t _n {0};
  double _ema {0.0};
}; // class Pace

} // namespace Slidr

#endif // SLIDR_PACE_HH
