#include "args.hpp"

#include "pn/errors.hpp"
#include "pn/io/hd5.hpp"
#include "pn/log/log.hpp"
#include "pn/noise/prewhiten.hpp"

#include <algorithm>

using namespace pn;

namespace {
template <int N>
void Run(HD5::Reader const &reader, std::string const &dset, Eigen::MatrixXcd const &W, std::string const &oname)
{
  auto const data = reader.readTensor<CxdN<N>>(dset);
  auto       names = reader.readDNames<N>(dset);
  if (std::any_of(names.begin(), names.end(), [](std::string const &n) { return n.empty(); })) {
    names = HD5::ChannelFirst<N>();
  }
  CxdN<N> const white = Noise::Prewhiten<N>(data, W);
  HD5::Writer   writer(oname);
  writer.writeTensor(HD5::Keys::Data, white.dimensions(), white.data(), names);
  writer.writeStrings(HD5::Keys::Log, Log::Saved());
}
} // namespace

void main_prewhiten(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file");

  args::ValueFlag<std::string> matFile(parser, "F", "Read prewhitening matrix from file", {"matrix", 'm'});
  args::ValueFlag<std::string> dset(parser, "D", "Dataset to prewhiten (data)", {"dset"}, HD5::Keys::Data);

  ParseCommand(parser, iname, oname);
  auto const cmd = parser.GetCommand().Name();
  if (!matFile) { throw args::Error("No prewhitening matrix file specified"); }

  HD5::Reader            matReader(matFile.Get());
  Eigen::MatrixXcd const W = matReader.readMatrix<Eigen::MatrixXcd>(HD5::Keys::Prewhiten);

  HD5::Reader reader(iname.Get());
  auto const  order = reader.order(dset.Get());
  switch (order) {
  case 2: Run<2>(reader, dset.Get(), W, oname.Get()); break;
  case 3: Run<3>(reader, dset.Get(), W, oname.Get()); break;
  case 4: Run<4>(reader, dset.Get(), W, oname.Get()); break;
  case 5: Run<5>(reader, dset.Get(), W, oname.Get()); break;
  case 6: Run<6>(reader, dset.Get(), W, oname.Get()); break;
  default: throw InvalidShape(cmd, "Data must have order 2-6, was {}", order);
  }
  Log::Print(cmd, "Finished");
}
