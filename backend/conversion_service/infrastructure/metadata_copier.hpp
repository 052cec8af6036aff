#pragma once
#include <expected>
#include <string>

namespace conversion_service {

// Copies container/EXIF metadata from the source into the converted file
// in place (exiftool -tagsFromFile ... -overwrite_original).
class MetadataCopier {
public:
  explicit MetadataCopier(std::string tool_path);

  std::expected<void, std::string> copy(const std::string& input_path,
                                        const std::string& output_path) const;

private:
  std::string tool_path_;
};

} // namespace conversion_service
