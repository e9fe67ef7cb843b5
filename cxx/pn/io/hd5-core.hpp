#pragma once

#include <array>
#include <cstdint>
#include <fmt/format.h>
#include <string>
#include <vector>

namespace pn {
namespace HD5 {

using Handle = int64_t;
using Index = long int;

template <typename T> struct type_tag
{
};

template <size_t N> using Shape = std::array<Index, N>;

template <typename T> Handle type_impl(type_tag<T>);

template <typename T> Handle type() { return type_impl(type_tag<T>{}); }

void        Init();
auto        Exists(Handle const h, std::string const &name) -> bool;
void        CheckedCall(int status, std::string const &msg);
std::string GetError();

namespace Keys {
std::string const Covariance = "covariance";
std::string const Data = "data";
std::string const Log = "log";
std::string const Power = "power";
std::string const Prewhiten = "prewhiten";
} // namespace Keys

// Horrible hack due to DSizes shenanigans
template <size_t N> struct DNames : std::array<std::string, N>
{
};

namespace Dims {
DNames<3> const Channels2 = {"channel", "i", "j"};
DNames<4> const Channels3 = {"channel", "i", "j", "k"};
DNames<2> const Image2 = {"i", "j"};
DNames<3> const Image3 = {"i", "j", "k"};
DNames<2> const Matrix = {"oc", "ic"};
DNames<3> const Pairs2 = {"pair", "i", "j"};
DNames<4> const Pairs3 = {"pair", "i", "j", "k"};
} // namespace Dims

//! Channel first, remaining dimensions numbered. For data that arrives without labels
template <size_t N> auto ChannelFirst() -> DNames<N>
{
  DNames<N> names;
  names[0] = "channel";
  for (size_t ii = 1; ii < N; ii++) {
    names[ii] = fmt::format("d{}", ii);
  }
  return names;
}

} // namespace HD5
} // namespace pn
