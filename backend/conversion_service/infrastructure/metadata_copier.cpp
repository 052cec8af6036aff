#include "metadata_copier.hpp"
#include "encoder_process.hpp"
#include <memory>
#include <boost/process.hpp>

namespace bp = boost::process;

namespace conversion_service {

MetadataCopier::MetadataCopier(std::string tool_path) : tool_path_(std::move(tool_path)) {}

std::expected<void, std::string> MetadataCopier::copy(const std::string& input_path,
                                                      const std::string& output_path) const {
  auto exe = resolveExecutable(tool_path_);
  if (!exe) {
    return std::unexpected(exe.error());
  }

  std::vector<std::string> args = {
    "-tagsFromFile", input_path,
    "-all:all>all:all",
    "-preserve",
    "-overwrite_original",
    output_path
  };

  std::string output;
  try {
    std::unique_ptr<bp::ipstream> out;
    bp::child tool;
    {
      std::lock_guard<std::mutex> lock(processLaunchMutex());
      out = std::make_unique<bp::ipstream>();
      markCloseOnExec(*out);
      tool = bp::child(bp::exe = *exe, bp::args = args,
                       (bp::std_out & bp::std_err) > *out,
                       bp::std_in < bp::null);
    }

    std::string line;
    while (std::getline(*out, line)) {
      output += line + "\n";
    }
    tool.wait();

    if (tool.exit_code() != 0) {
      return std::unexpected("exit code " + std::to_string(tool.exit_code()) + ", output: " + output);
    }
  } catch (const bp::process_error& e) {
    return std::unexpected(std::string(e.what()));
  }
  return {};
}

} // namespace conversion_service
