#include "args.hpp"

#include "pn/errors.hpp"
#include "pn/io/hd5.hpp"
#include "pn/log/log.hpp"
#include "pn/noise/prewhiten.hpp"
#include "pn/tensors.hpp"

using namespace pn;

namespace {
template <int N> auto ReadNoise(HD5::Reader const &reader, std::string const &dset) -> Eigen::MatrixXcd
{
  auto const noise = reader.readTensor<CxdN<N>>(dset);
  return ChannelConstMatrix(noise);
}
} // namespace

void main_noise_cov(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file with noise samples");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file for the prewhitening matrix");

  args::ValueFlag<double>      scale(parser, "S", "Scale factor (1)", {"scale", 's'});
  ArrayFlag<double, 2>         dwell(parser, "A,N", "Acquisition and noise dwell times (sets scale)", {"dwell"});
  args::ValueFlag<double>      bwRatio(parser, "R", "Noise receiver bandwidth ratio (1)", {"bw-ratio"}, 1.);
  args::ValueFlag<std::string> dset(parser, "D", "Dataset to read (data)", {"dset"}, HD5::Keys::Data);

  ParseCommand(parser, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  double s = 1.;
  if (scale && dwell) {
    throw args::Error("Specify either --scale or --dwell, not both");
  } else if (scale) {
    s = scale.Get();
  } else if (dwell) {
    if (!(dwell.Get()[1] > 0.)) { throw Log::Failure(cmd, "Noise dwell time must be positive, was {}", dwell.Get()[1]); }
    s = dwell.Get()[0] / dwell.Get()[1] * bwRatio.Get();
    Log::Print(cmd, "Dwell times {} and {} bandwidth ratio {} gives scale {}", dwell.Get()[0], dwell.Get()[1], bwRatio.Get(), s);
  }

  HD5::Reader      reader(iname.Get());
  auto const       order = reader.order(dset.Get());
  Eigen::MatrixXcd noise;
  switch (order) {
  case 2: noise = ReadNoise<2>(reader, dset.Get()); break;
  case 3: noise = ReadNoise<3>(reader, dset.Get()); break;
  case 4: noise = ReadNoise<4>(reader, dset.Get()); break;
  case 5: noise = ReadNoise<5>(reader, dset.Get()); break;
  case 6: noise = ReadNoise<6>(reader, dset.Get()); break;
  default: throw InvalidShape(cmd, "Noise data must have order 2-6, was {}", order);
  }

  Eigen::MatrixXcd const C = Noise::Covariance(noise);
  Eigen::MatrixXcd const W = Noise::CholeskyWhitening(C, s);

  HD5::Writer writer(oname.Get());
  writer.writeMatrix(HD5::Keys::Prewhiten, W, HD5::Dims::Matrix);
  writer.writeMatrix(HD5::Keys::Covariance, C, HD5::Dims::Matrix);
  writer.writeStrings(HD5::Keys::Log, Log::Saved());
  Log::Print(cmd, "Finished");
}
