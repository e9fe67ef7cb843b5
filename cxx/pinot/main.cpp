#include "args.hpp"
#include "pn/log/log.hpp"

using namespace pn;

#define COMMAND(PARSER, NM, CMD, DESC)                                                                                         \
  void          main_##NM(args::Subparser &parser);                                                                            \
  args::Command NM(PARSER, CMD, DESC, &main_##NM);

int main(int const argc, char const *const argv[])
{
  args::ArgumentParser parser("PINOT");
  args::GlobalOptions  globals(parser, global_group);

  args::Group sense(parser, "SENSE");
  COMMAND(sense, sense_walsh, "sense-walsh", "Estimate coil sensitivities with Walsh's method");
  COMMAND(sense, sense_combine, "sense-combine", "Combine channel images with sensitivity maps");

  args::Group noise(parser, "NOISE");
  COMMAND(noise, noise_cov, "noise-cov", "Calculate a prewhitening matrix from noise data");
  COMMAND(noise, prewhiten, "prewhiten", "Apply a prewhitening matrix");

  args::Group util(parser, "UTIL");
  COMMAND(util, log, "log", "Print the log stored in an output file");
  COMMAND(util, smooth, "smooth", "Box-smooth channel images");

  try {
    parser.ParseCLI(argc, argv);
    Log::End();
  } catch (args::Help &) {
    fmt::print(stderr, "{}\n", parser.Help());
    return EXIT_SUCCESS;
  } catch (args::Error &e) {
    fmt::print(stderr, "{}\n", parser.Help());
    fmt::print(stderr, fmt::fg(fmt::terminal_color::bright_red), "{}\n", e.what());
    return EXIT_FAILURE;
  } catch (Log::Failure &f) {
    Log::Fail(f);
    Log::End();
    return EXIT_FAILURE;
  } catch (std::exception const &e) {
    Log::Fail(Log::Failure("None", "{}", e.what()));
    Log::End();
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
