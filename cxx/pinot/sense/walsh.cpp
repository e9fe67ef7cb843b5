#include "args.hpp"

#include "pn/coils/walsh.hpp"
#include "pn/errors.hpp"
#include "pn/io/hd5.hpp"
#include "pn/log/log.hpp"

using namespace pn;

namespace {
template <int ND>
void Run(HD5::Reader const &reader, std::string const &dset, Coils::WalshOpts const &opts, std::string const &oname)
{
  auto const images = reader.readTensor<CxdN<ND + 1>>(dset);
  auto const result = Coils::Walsh<ND>(images, opts);

  HD5::Writer writer(oname);
  if constexpr (ND == 2) {
    writer.writeTensor(HD5::Keys::Data, result.maps.dimensions(), result.maps.data(), HD5::Dims::Channels2);
    writer.writeTensor(HD5::Keys::Power, result.power.dimensions(), result.power.data(), HD5::Dims::Image2);
  } else {
    writer.writeTensor(HD5::Keys::Data, result.maps.dimensions(), result.maps.data(), HD5::Dims::Channels3);
    writer.writeTensor(HD5::Keys::Power, result.power.dimensions(), result.power.data(), HD5::Dims::Image3);
  }
  writer.writeStrings(HD5::Keys::Log, Log::Saved());
}
} // namespace

void main_sense_walsh(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file with channel images");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file for maps and power");

  args::ValueFlag<Index>       window(parser, "W", "Smoothing window (5)", {"window", 'w'}, 5);
  args::ValueFlag<Index>       its(parser, "N", "Power iterations (3)", {"its"}, 3);
  args::Flag                   strict(parser, "S", "Fail if any pixel has no signal", {"strict"});
  args::ValueFlag<std::string> dset(parser, "D", "Dataset to read (data)", {"dset"}, HD5::Keys::Data);

  ParseCommand(parser, iname, oname);
  auto const  cmd = parser.GetCommand().Name();
  HD5::Reader reader(iname.Get());

  Coils::WalshOpts const opts{.window = window.Get(), .iterations = its.Get(), .strict = strict.Get()};
  auto const             order = reader.order(dset.Get());
  switch (order) {
  case 3: Run<2>(reader, dset.Get(), opts, oname.Get()); break;
  case 4: Run<3>(reader, dset.Get(), opts, oname.Get()); break;
  default: throw InvalidShape(cmd, "Channel images must be (channel, i, j) or (channel, i, j, k), order was {}", order);
  }
  Log::Print(cmd, "Finished");
}
