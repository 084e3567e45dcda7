#include "psychro/io/output/hdf5_writer.hpp"
#include "psychro/core/expected_utils.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <tuple>
#include <vector>

namespace psychro::io::output {

auto HDF5Writer::write(const std::filesystem::path& file_path,
                       const OutputDataset& dataset) const -> std::expected<void, OutputError> {

  try {
    auto file_result = create_file(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    if (auto meta_result = write_metadata(file, dataset.metadata); !meta_result) {
      return std::unexpected(meta_result.error());
    }

    auto cases_group_result = create_group(file, "cases");
    if (!cases_group_result) {
      return std::unexpected(cases_group_result.error());
    }
    auto cases_group = std::move(cases_group_result.value());

    for (const auto& record : dataset.cases) {
      if (auto result = write_case(cases_group, record); !result) {
        return std::unexpected(result.error());
      }
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("HDF5 write failed: {}", e.what())));
  }
}

auto HDF5Writer::create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError> {

  auto fapl = H5Pcreate(H5P_FILE_ACCESS);
  if (fapl < 0) {
    return std::unexpected(OutputError("Failed to create file access property list"));
  }

  // Set close degree (for proper cleanup)
  H5Pset_fclose_degree(fapl, H5F_CLOSE_STRONG);

  auto file_id = H5Fcreate(file_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl);
  H5Pclose(fapl);

  if (file_id < 0) {
    return std::unexpected(FileWriteError(file_path, "Failed to create HDF5 file"));
  }

  try {
    return FileHandle(file_id);
  } catch (const std::exception& e) {
    H5Fclose(file_id);
    return std::unexpected(OutputError(e.what()));
  }
}

auto HDF5Writer::write_metadata(FileHandle& file,
                                const ResultMetadata& metadata) const -> std::expected<void, OutputError> {

  auto metadata_group_result = create_group(file, "metadata");
  if (!metadata_group_result) {
    return std::unexpected(metadata_group_result.error());
  }
  auto metadata_group = std::move(metadata_group_result.value());

  if (auto result = write_string(metadata_group, "psychro_version", metadata.psychro_version); !result) {
    return std::unexpected(result.error());
  }

  auto time_t = std::chrono::system_clock::to_time_t(metadata.creation_time);
  auto tm = *std::gmtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  if (auto result = write_string(metadata_group, "creation_time", oss.str()); !result) {
    return std::unexpected(result.error());
  }

  if (!metadata.case_file.empty()) {
    if (auto result = write_string(metadata_group, "case_file", metadata.case_file); !result) {
      return std::unexpected(result.error());
    }
  }

  if (auto result = write_scalar(metadata_group, "solver_tolerance", metadata.solver.tolerance); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(metadata_group, "solver_max_iterations", metadata.solver.max_iterations); !result) {
    return std::unexpected(result.error());
  }

  return {};
}

auto HDF5Writer::write_case(hid_t parent, const CaseRecord& record) const -> std::expected<void, OutputError> {

  auto group_result = create_group(parent, record.name);
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto result = write_string(group, "type", std::string(to_string(record.type))); !result) {
    return std::unexpected(result.error());
  }

  for (std::size_t i = 0; i < record.inlets.size(); ++i) {
    auto name = record.inlets.size() == 1 ? std::string("inlet") : std::format("inlet_{}", i);
    if (auto result = write_stream(group, name, record.inlets[i]); !result) {
      return std::unexpected(result.error());
    }
  }
  if (auto result = write_stream(group, "outlet", record.outlet); !result) {
    return std::unexpected(result.error());
  }

  if (auto result = write_scalar(group, "heat_of_process", record.heat_of_process, "W"); !result) {
    return std::unexpected(result.error());
  }
  if (record.condensate_mass_flow) {
    if (auto result = write_scalar(group, "condensate_mass_flow", *record.condensate_mass_flow, "kg/s"); !result) {
      return std::unexpected(result.error());
    }
  }
  if (record.condensate_temperature) {
    if (auto result = write_scalar(group, "condensate_temperature", *record.condensate_temperature, "degC");
        !result) {
      return std::unexpected(result.error());
    }
  }
  if (record.bypass_factor) {
    if (auto result = write_scalar(group, "bypass_factor", *record.bypass_factor, "-"); !result) {
      return std::unexpected(result.error());
    }
  }
  if (record.coolant_mass_flow) {
    if (auto result = write_scalar(group, "coolant_mass_flow", *record.coolant_mass_flow, "kg/s"); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_stream(hid_t parent, const std::string& name,
                              const StreamRecord& stream) const -> std::expected<void, OutputError> {

  auto group_result = create_group(parent, name);
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  const std::array<std::tuple<const char*, double, const char*>, 9> fields{{
      {"pressure", stream.pressure, "Pa"},
      {"temperature", stream.temperature, "degC"},
      {"humidity_ratio", stream.humidity_ratio, "kg/kg"},
      {"relative_humidity", stream.relative_humidity, "%"},
      {"specific_enthalpy", stream.specific_enthalpy, "kJ/kg"},
      {"dew_point_temperature", stream.dew_point_temperature, "degC"},
      {"dry_air_mass_flow", stream.dry_air_mass_flow, "kg/s"},
      {"humid_air_mass_flow", stream.humid_air_mass_flow, "kg/s"},
      {"volumetric_flow", stream.volumetric_flow, "m3/s"},
  }};

  for (const auto& [field, value, units] : fields) {
    if (auto result = write_scalar(group, field, value, units); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::create_group(hid_t parent, const std::string& name) const -> std::expected<GroupHandle, OutputError> {

  auto group_id = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create group '{}'", name)));
  }

  try {
    return GroupHandle(group_id);
  } catch (const std::exception& e) {
    H5Gclose(group_id);
    return std::unexpected(OutputError(e.what()));
  }
}

auto HDF5Writer::write_dataset(hid_t parent, const std::string& name, std::span<const hsize_t> dims,
                               const double* data, const std::string& units,
                               const std::string& description) const -> std::expected<void, OutputError> {

  auto space_id = dims.empty() ? H5Screate(H5S_SCALAR)
                               : H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_dataset_properties(dims);
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  if (!units.empty()) {
    PSYCHRO_TRY_VOID(write_string(dataset, "units", units));
  }
  if (!description.empty()) {
    PSYCHRO_TRY_VOID(write_string(dataset, "description", description));
  }
  return {};
}

auto HDF5Writer::write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {
  if (data.empty()) {
    return {};
  }
  const std::array<hsize_t, 1> dims{data.size()};
  return write_dataset(parent, name, dims, data.data(), units, description);
}

auto HDF5Writer::write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {
  if (data.rows() == 0 || data.cols() == 0) {
    return {};
  }
  // Eigen storage is column-major
  const auto row_major_data = data.row_major();
  const std::array<hsize_t, 2> dims{data.rows(), data.cols()};
  return write_dataset(parent, name, dims, row_major_data.data(), units, description);
}

auto HDF5Writer::write_scalar(hid_t parent, const std::string& name, double value, const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {
  return write_dataset(parent, name, {}, &value, units, description);
}

auto HDF5Writer::write_string(hid_t parent, const std::string& name,
                              const std::string& value) const -> std::expected<void, OutputError> {

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  H5Tset_size(string_type, std::max<std::size_t>(value.length(), 1));
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string '{}'", name)));
  }
  DataspaceHandle space(space_id);

  const H5I_type_t obj_type = H5Iget_type(parent);
  if (obj_type != H5I_DATASET && obj_type != H5I_GROUP && obj_type != H5I_FILE) {
    return std::unexpected(OutputError(std::format("Cannot attach string attribute '{}' to this object", name)));
  }

  auto attr_id = H5Acreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string attribute '{}'", name)));
  }

  auto status = H5Awrite(attr_id, string_type, value.c_str());
  H5Aclose(attr_id);

  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string attribute '{}'", name)));
  }

  return {};
}

auto HDF5Writer::create_dataset_properties(std::span<const hsize_t> dims) const
    -> std::expected<PropertyHandle, OutputError> {

  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  // Scalars cannot be chunked
  if (dims.empty() || hdf5_config_.compression_level <= 0) {
    return props;
  }

  std::vector<hsize_t> chunk(dims.begin(), dims.end());
  for (auto& extent : chunk) {
    extent = std::max<hsize_t>(std::min<hsize_t>(extent, hdf5_config_.chunk_size), 1);
  }

  if (H5Pset_chunk(props, static_cast<int>(chunk.size()), chunk.data()) < 0) {
    return std::unexpected(OutputError("Failed to set chunking"));
  }
  if (hdf5_config_.use_shuffle_filter) {
    H5Pset_shuffle(props);
  }
  H5Pset_deflate(props, hdf5_config_.compression_level);

  return props;
}

// HDF5 convenience functions
namespace hdf5 {

auto initialize() -> std::expected<void, OutputError> {
  if (H5open() < 0) {
    return std::unexpected(OutputError("Failed to initialize HDF5 library"));
  }
  return {};
}

auto finalize() -> void { H5close(); }

} // namespace hdf5

} // namespace psychro::io::output
