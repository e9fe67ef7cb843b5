#include "args.hpp"

#include "pn/errors.hpp"
#include "pn/io/hd5.hpp"
#include "pn/log/log.hpp"
#include "pn/smooth.hpp"

using namespace pn;

namespace {
template <int ND> void Run(HD5::Reader const &reader, Index const window, std::string const &oname)
{
  auto images = reader.readTensor<CxdN<ND + 1>>();
  SmoothBatch<ND>(images, window);
  HD5::Writer writer(oname);
  if constexpr (ND == 2) {
    writer.writeTensor(HD5::Keys::Data, images.dimensions(), images.data(), HD5::Dims::Channels2);
  } else {
    writer.writeTensor(HD5::Keys::Data, images.dimensions(), images.data(), HD5::Dims::Channels3);
  }
  writer.writeStrings(HD5::Keys::Log, Log::Saved());
}
} // namespace

void main_smooth(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file with channel images");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file");
  args::ValueFlag<Index>        window(parser, "W", "Smoothing window (5)", {"window", 'w'}, 5);

  ParseCommand(parser, iname, oname);
  auto const  cmd = parser.GetCommand().Name();
  HD5::Reader reader(iname.Get());
  auto const  order = reader.order();
  switch (order) {
  case 3: Run<2>(reader, window.Get(), oname.Get()); break;
  case 4: Run<3>(reader, window.Get(), oname.Get()); break;
  default: throw InvalidShape(cmd, "Channel images must be (channel, i, j) or (channel, i, j, k), order was {}", order);
  }
  Log::Print(cmd, "Finished");
}
