#pragma once
#include "../../core/containers.hpp"
#include "output_types.hpp"
#include <hdf5.h>
#include <span>
#include <string_view>

namespace psychro::io::output {

// HDF5-specific configuration
struct HDF5Config {
  int compression_level = constants::io::default_hdf5_compression; // 0-9, higher = better compression
  bool use_shuffle_filter = true;                                 // Reorder bytes for better compression
  std::size_t chunk_size = constants::io::default_hdf5_chunk_size;
};

// RAII wrapper for HDF5 handles
template <typename HandleType, auto CloseFunc> class HDF5Handle {
private:
  HandleType handle_;

public:
  explicit HDF5Handle(HandleType handle) : handle_(handle) {
    if (handle_ < 0) {
      throw OutputError("Invalid HDF5 handle");
    }
  }

  ~HDF5Handle() {
    if (handle_ >= 0) {
      CloseFunc(handle_);
    }
  }

  // Move semantics only
  HDF5Handle(HDF5Handle&& other) noexcept : handle_(other.handle_) { other.handle_ = constants::io::invalid_hdf5_handle; }

  HDF5Handle& operator=(HDF5Handle&& other) noexcept {
    if (this != &other) {
      if (handle_ >= 0) {
        CloseFunc(handle_);
      }
      handle_ = other.handle_;
      other.handle_ = constants::io::invalid_hdf5_handle;
    }
    return *this;
  }

  HDF5Handle(const HDF5Handle&) = delete;
  HDF5Handle& operator=(const HDF5Handle&) = delete;

  [[nodiscard]] auto get() const noexcept -> HandleType { return handle_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return handle_ >= 0; }

  // Implicit conversion for C API
  operator HandleType() const noexcept { return handle_; }
};

using FileHandle = HDF5Handle<hid_t, H5Fclose>;
using GroupHandle = HDF5Handle<hid_t, H5Gclose>;
using DatasetHandle = HDF5Handle<hid_t, H5Dclose>;
using DataspaceHandle = HDF5Handle<hid_t, H5Sclose>;
using PropertyHandle = HDF5Handle<hid_t, H5Pclose>;
using TypeHandle = HDF5Handle<hid_t, H5Tclose>;

/**
 * @brief Writes case results as /metadata plus one group per case under /cases
 *
 * The dataset helpers are public so the chart generator writes through the
 * same handles and filters.
 */
class HDF5Writer : public FormatWriter {
private:
  HDF5Config hdf5_config_;

  [[nodiscard]] auto write_metadata(FileHandle& file, const ResultMetadata& metadata) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_case(hid_t parent, const CaseRecord& record) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_stream(hid_t parent, const std::string& name, const StreamRecord& stream) const
      -> std::expected<void, OutputError>;

  // Chunked and deflated unless the dataset is scalar or compression is off
  [[nodiscard]] auto create_dataset_properties(std::span<const hsize_t> dims) const
      -> std::expected<PropertyHandle, OutputError>;

  // Empty dims write a scalar
  [[nodiscard]] auto write_dataset(hid_t parent, const std::string& name, std::span<const hsize_t> dims,
                                   const double* data, const std::string& units,
                                   const std::string& description) const -> std::expected<void, OutputError>;

public:
  explicit HDF5Writer(HDF5Config config = {}) : hdf5_config_(config) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path,
                           const OutputDataset& dataset) const -> std::expected<void, OutputError> override;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view override { return ".h5"; }

  [[nodiscard]] auto create_file(const std::filesystem::path& file_path) const
      -> std::expected<FileHandle, OutputError>;

  [[nodiscard]] auto create_group(hid_t parent, const std::string& name) const
      -> std::expected<GroupHandle, OutputError>;

  [[nodiscard]] auto write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                                  const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                                  const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_scalar(hid_t parent, const std::string& name, double value, const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  /// String attribute on a group or dataset
  [[nodiscard]] auto write_string(hid_t parent, const std::string& name,
                                  const std::string& value) const -> std::expected<void, OutputError>;
};

// Convenience functions for HDF5
namespace hdf5 {

// Initialize HDF5 library (call once at program start)
auto initialize() -> std::expected<void, OutputError>;

// Cleanup HDF5 library (call at program end)
auto finalize() -> void;

} // namespace hdf5

} // namespace psychro::io::output
