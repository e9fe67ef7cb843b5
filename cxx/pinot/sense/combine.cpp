#include "args.hpp"

#include "pn/coils/combine.hpp"
#include "pn/errors.hpp"
#include "pn/io/hd5.hpp"
#include "pn/log/log.hpp"

using namespace pn;

namespace {
template <int ND> void Run(HD5::Reader const &reader, HD5::Reader const &mapsReader, std::string const &oname)
{
  auto const     images = reader.readTensor<CxdN<ND + 1>>();
  auto const     maps = mapsReader.readTensor<CxdN<ND + 1>>();
  CxdN<ND> const combined = Coils::Combine<ND>(images, maps);
  HD5::Writer    writer(oname);
  if constexpr (ND == 2) {
    writer.writeTensor(HD5::Keys::Data, combined.dimensions(), combined.data(), HD5::Dims::Image2);
  } else {
    writer.writeTensor(HD5::Keys::Data, combined.dimensions(), combined.data(), HD5::Dims::Image3);
  }
  writer.writeStrings(HD5::Keys::Log, Log::Saved());
}
} // namespace

void main_sense_combine(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file with channel images");
  args::Positional<std::string> mname(parser, "FILE", "HD5 file with sensitivity maps");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file");

  ParseCommand(parser, iname, mname);
  auto const cmd = parser.GetCommand().Name();
  if (!oname) { throw args::Error("No output file specified"); }

  HD5::Reader reader(iname.Get());
  HD5::Reader mapsReader(mname.Get());
  auto const  order = reader.order();
  if (mapsReader.order() != order) {
    throw ShapeMismatch(cmd, "Images have order {} but maps have order {}", order, mapsReader.order());
  }
  switch (order) {
  case 3: Run<2>(reader, mapsReader, oname.Get()); break;
  case 4: Run<3>(reader, mapsReader, oname.Get()); break;
  default: throw InvalidShape(cmd, "Channel images must be (channel, i, j) or (channel, i, j, k), order was {}", order);
  }
  Log::Print(cmd, "Finished");
}
