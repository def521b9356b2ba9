#include "h5tree/h5/reader.hpp"

#include "h5tree/core/error.hpp"
#include "h5tree/h5/value_reader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <string_view>
#include <utility>
#include <vector>

namespace h5tree::h5 {
namespace {

// 对象在文件中的唯一标识（fileno + 地址/token）。
using ObjectKey = std::string;

[[nodiscard]] std::error_code unreadable_(std::string& out_err, std::string_view context) {
  out_err = error_stack_message(context);
  return core::make_error_code(core::errc::unreadable_file);
}

[[nodiscard]] bool object_key_(hid_t object, ObjectKey& out) {
#if H5_VERSION_GE(1, 12, 0)
  H5O_info2_t info;
  if (H5Oget_info3(object, &info, H5O_INFO_BASIC) < 0) {
    return false;
  }
  out = std::to_string(info.fileno) + ":" +
        std::string(reinterpret_cast<const char*>(&info.token), sizeof(info.token));
#else
  H5O_info_t info;
  if (H5Oget_info2(object, &info, H5O_INFO_BASIC) < 0) {
    return false;
  }
  out = std::to_string(info.fileno) + ":" + std::to_string(info.addr);
#endif
  return true;
}

[[nodiscard]] H5_index_t link_index_(hid_t group) {
  Handle gcpl(H5Gget_create_plist(group), H5Pclose);
  unsigned flags = 0;
  if (gcpl.valid() && H5Pget_link_creation_order(gcpl.id(), &flags) >= 0 &&
      (flags & H5P_CRT_ORDER_TRACKED) != 0) {
    return H5_INDEX_CRT_ORDER;
  }
  return H5_INDEX_NAME;
}

[[nodiscard]] H5_index_t attribute_index_(hid_t ocpl) {
  unsigned flags = 0;
  if (ocpl >= 0 && H5Pget_attr_creation_order(ocpl, &flags) >= 0 &&
      (flags & H5P_CRT_ORDER_TRACKED) != 0) {
    return H5_INDEX_CRT_ORDER;
  }
  return H5_INDEX_NAME;
}

[[nodiscard]] std::error_code link_names_(hid_t group, std::vector<std::string>& out, std::string& out_err) {
  const auto callback = [](hid_t, const char* name, const H5L_info_t*, void* op_data) -> herr_t {
    static_cast<std::vector<std::string>*>(op_data)->emplace_back(name);
    return 0;
  };
  if (H5Literate(group, link_index_(group), H5_ITER_INC, nullptr, callback, &out) < 0) {
    return unreadable_(out_err, "unable to iterate group links");
  }
  return {};
}

void read_attributes_(hid_t object, hid_t ocpl, const std::string& path, model::AttributeList& out) {
  std::vector<std::string> names;
  const auto callback = [](hid_t, const char* name, const H5A_info_t*, void* op_data) -> herr_t {
    static_cast<std::vector<std::string>*>(op_data)->emplace_back(name);
    return 0;
  };
  if (H5Aiterate2(object, attribute_index_(ocpl), H5_ITER_INC, nullptr, callback, &names) < 0) {
    spdlog::warn("{}: unable to iterate attributes: {}", path,
                 error_stack_message("attribute iteration failed"));
    return;
  }

  for (auto& name : names) {
    auto value = model::Value::opaque({});
    std::string err;
    Handle attr(H5Aopen(object, name.c_str(), H5P_DEFAULT), H5Aclose);
    std::error_code ec;
    if (!attr.valid()) {
      err = error_stack_message("unable to open attribute");
      ec = core::make_error_code(core::errc::read_failed);
    } else {
      ec = read_value(attr.id(), Source::attribute, value, err);
    }
    if (ec) {
      spdlog::warn("{}: attribute '{}' unreadable: {}", path, name, err);
      value = model::Value::opaque("<unreadable attribute: " + err + ">");
    }
    out.push_back(model::Attribute{std::move(name), std::move(value)});
  }
}

struct LoadContext final {
  std::shared_ptr<Handle> file;
  std::vector<ObjectKey> ancestors;
};

[[nodiscard]] std::error_code load_dataset_(LoadContext& ctx,
                                            hid_t dataset,
                                            model::Dataset& out,
                                            std::string& out_err) {
  if (auto ec = read_dataset_layout(dataset, out.shape, out.size, out.dtype, out_err)) {
    return core::make_error_code(core::errc::unreadable_file);
  }
  {
    Handle dcpl(H5Dget_create_plist(dataset), H5Pclose);
    read_attributes_(dataset, dcpl.id(), out.path, out.attributes);
  }

  out.loader = [file = ctx.file, path = out.path](model::Value& value, std::string& err) -> std::error_code {
    Handle dset(H5Dopen2(file->id(), path.c_str(), H5P_DEFAULT), H5Dclose);
    if (!dset.valid()) {
      err = error_stack_message("unable to open dataset");
      return core::make_error_code(core::errc::read_failed);
    }
    return read_value(dset.id(), Source::dataset, value, err);
  };
  return {};
}

[[nodiscard]] std::error_code load_group_(LoadContext& ctx,
                                          hid_t group,
                                          model::Group& out,
                                          std::string& out_err) {
  spdlog::debug("load group {}", out.path);
  {
    Handle gcpl(H5Gget_create_plist(group), H5Pclose);
    read_attributes_(group, gcpl.id(), out.path, out.attributes);
  }

  std::vector<std::string> names;
  if (auto ec = link_names_(group, names, out_err)) {
    return ec;
  }

  for (auto& name : names) {
    const auto path = model::join_path(out.path, name);

    H5L_info_t link{};
    if (H5Lget_info(group, name.c_str(), &link, H5P_DEFAULT) < 0) {
      spdlog::warn("{}: unable to query link: {}", path, error_stack_message("link query failed"));
      continue;
    }
    if (link.type != H5L_TYPE_HARD && H5Oexists_by_name(group, name.c_str(), H5P_DEFAULT) <= 0) {
      (void)H5Eclear2(H5E_DEFAULT);
      spdlog::warn("{}: dangling link skipped", path);
      continue;
    }

    Handle object(H5Oopen(group, name.c_str(), H5P_DEFAULT), H5Oclose);
    if (!object.valid()) {
      spdlog::warn("{}: unable to open object: {}", path, error_stack_message("open failed"));
      continue;
    }

    switch (H5Iget_type(object.id())) {
      case H5I_GROUP: {
        model::Group child{name, path, {}, {}};
        ObjectKey key;
        const bool keyed = object_key_(object.id(), key);
        if (keyed && std::find(ctx.ancestors.begin(), ctx.ancestors.end(), key) != ctx.ancestors.end()) {
          spdlog::warn("{}: link back to an ancestor group, not expanded", path);
          out.children.emplace_back(std::move(child));
          break;
        }
        if (keyed) {
          ctx.ancestors.push_back(key);
        }
        const auto ec = load_group_(ctx, object.id(), child, out_err);
        if (keyed) {
          ctx.ancestors.pop_back();
        }
        if (ec) {
          return ec;
        }
        out.children.emplace_back(std::move(child));
        break;
      }
      case H5I_DATASET: {
        model::Dataset child;
        child.name = name;
        child.path = path;
        if (auto ec = load_dataset_(ctx, object.id(), child, out_err)) {
          return ec;
        }
        out.children.emplace_back(std::move(child));
        break;
      }
      default:
        spdlog::debug("{}: not a group or dataset, skipped", path);
        break;
    }
  }
  return {};
}

}  // namespace

std::error_code File::open(const std::string& path, File& out, std::string& out_err) {
  std::error_code fs_ec;
  if (!std::filesystem::exists(path, fs_ec)) {
    out_err = "No such file or directory";
    return core::make_error_code(core::errc::file_not_found);
  }

  silence_error_printing();
  const hid_t id = H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (id < 0) {
    return unreadable_(out_err, "unable to open file");
  }

  spdlog::debug("opened {}", path);
  out.handle_ = std::make_shared<Handle>(id, H5Fclose);
  out.path_ = path;
  return {};
}

std::error_code load_root(const File& file, model::Group& out, std::string& out_err) {
  if (!file.is_open()) {
    out_err = "file is not open";
    return core::make_error_code(core::errc::unreadable_file);
  }

  Handle root(H5Gopen2(file.id(), "/", H5P_DEFAULT), H5Gclose);
  if (!root.valid()) {
    return unreadable_(out_err, "unable to open root group");
  }

  out = model::Group{"/", "/", {}, {}};
  LoadContext ctx{file.handle_, {}};
  ObjectKey key;
  if (object_key_(root.id(), key)) {
    ctx.ancestors.push_back(key);
  }
  return load_group_(ctx, root.id(), out, out_err);
}

}  // namespace h5tree::h5
