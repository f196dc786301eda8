#include "args.hpp"
#include "pr/log/log.hpp"

using namespace pr;

#define COMMAND(PARSER, NM, CMD, DESC)                                                                                         \
  void          main_##NM(args::Subparser &parser);                                                                            \
  args::Command NM(PARSER, CMD, DESC, &main_##NM);

int main(int const argc, char const *const argv[])
{
  args::ArgumentParser parser("PRISM");
  args::GlobalOptions  globals(parser, global_group);

  args::Group pca(parser, "PCA");
  COMMAND(pca, fit, "fit", "Fit a PCA model to observations");
  COMMAND(pca, project, "project", "Project observations onto a fitted basis");
  COMMAND(pca, inverse, "inverse", "Reconstruct observations from reduced data");
  COMMAND(pca, variance, "variance", "Print the explained variance of a model");
  COMMAND(pca, pca_oneshot, "pca", "Fit and reduce in one step");

  args::Group util(parser, "UTIL");
  COMMAND(util, h5, "h5", "Inspect an H5 file");
  COMMAND(util, log, "log", "Print log to stdout");
  COMMAND(util, version, "version", "Print version number");

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
