#include "object_map.h"
#include "objmap_export.h"
#include "objmap_io.h"

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

static void print_usage()
{
  std::cerr << "Usage: objmapinfo <input.obj>"
            << " [--volume=N] [--encoding=auto|raw|rle] [--no-label-check]"
            << " [--json[=<path>]] [--png-slice=<z>] [--png-out=<path>] [--verbose]\n";
}

static bool parse_index(const std::string &value, long &out)
{
  char *endptr = nullptr;
  const long v = std::strtol(value.c_str(), &endptr, 10);
  if (endptr == value.c_str() || (endptr && *endptr != '\0') || v < 0)
    return false;
  out = v;
  return true;
}

static void print_summary(const std::string &path, const objmap::ObjectMap &map, int volume,
                          const objmap::DecodeOptions &opt)
{
  const objmap::VolumeData &vol = map.get_data(volume);
  std::cout << "Successfully imported " << path << "\n";
  std::cout << "Format version: " << map.version() << " (code " << map.version_code() << ")\n";
  std::cout << "Spatial map shape: (" << vol.get_depth() << ", " << vol.get_height() << ", "
            << vol.get_width() << ") x " << vol.element_width() << " byte(s)\n";
  std::cout << "Number of objects: " << map.object_count() << "\n";
  std::cout << "Number of volumes: " << map.volume_count() << "\n";
  std::cout << "Pixel encoding: " << objmap::to_string(opt.encoding)
            << ", label check: " << (opt.check_labels ? "on" : "off") << "\n";
}

static void print_objects(const objmap::ObjectMap &map, int volume)
{
  const auto counts = map.get_data(volume).label_histogram();
  std::cout << "\n label  voxels      visible  color          name\n";
  for (const auto &obj : map.objects())
  {
    const auto it = counts.find(obj.label);
    const std::size_t voxels = it == counts.end() ? 0 : it->second;
    std::cout << std::setw(6) << obj.label << "  " << std::setw(10) << voxels << "  "
              << std::setw(7) << (obj.visible() ? "yes" : "no") << "  "
              << std::setw(3) << obj.start_color[0] << " " << std::setw(3) << obj.start_color[1] << " "
              << std::setw(3) << obj.start_color[2] << "    " << obj.name << "\n";
  }
}

int main(int argc, char **argv)
{
  if (argc < 2)
  {
    print_usage();
    return 2;
  }
  std::string in_path = argv[1];
  if (in_path == "--help" || in_path == "-h")
  {
    print_usage();
    return 0;
  }

  objmap::DecodeOptions opt;
  long volume = 0;
  long png_slice = -1;
  std::string png_out;
  bool json_stdout = false;
  std::string json_path;
  bool verbose = false;

  for (int i = 2; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg.rfind("--volume=", 0) == 0)
    {
      const std::string v = arg.substr(9);
      if (!parse_index(v, volume))
      {
        std::cerr << "Invalid --volume: " << v << "\n";
        return 2;
      }
    }
    else if (arg.rfind("--encoding=", 0) == 0)
    {
      std::string e = arg.substr(11);
      if (e == "auto")
        opt.encoding = objmap::PixelEncoding::Auto;
      else if (e == "raw")
        opt.encoding = objmap::PixelEncoding::Raw;
      else if (e == "rle" || e == "run-length")
        opt.encoding = objmap::PixelEncoding::RunLength;
      else
      {
        std::cerr << "Invalid --encoding: " << e << "\n";
        return 2;
      }
    }
    else if (arg == "--no-label-check")
    {
      opt.check_labels = false;
    }
    else if (arg == "--json")
    {
      json_stdout = true;
    }
    else if (arg.rfind("--json=", 0) == 0)
    {
      json_path = arg.substr(7);
      if (json_path.empty())
      {
        std::cerr << "Invalid --json option\n";
        return 2;
      }
    }
    else if (arg.rfind("--png-slice=", 0) == 0)
    {
      const std::string v = arg.substr(12);
      if (!parse_index(v, png_slice))
      {
        std::cerr << "Invalid --png-slice: " << v << "\n";
        return 2;
      }
    }
    else if (arg.rfind("--png-out=", 0) == 0)
    {
      png_out = arg.substr(10);
      if (png_out.empty())
      {
        std::cerr << "Invalid --png-out option\n";
        return 2;
      }
    }
    else if (arg == "--verbose" || arg == "-v")
    {
      verbose = true;
    }
    else
    {
      std::cerr << "Unknown option: " << arg << "\n";
      return 2;
    }
  }

  if (!png_out.empty() && png_slice < 0)
  {
    std::cerr << "--png-out requires --png-slice\n";
    return 2;
  }

  objmap::ObjectMap map;
  try
  {
    map.from_file(in_path, opt);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Failed to load input: " << e.what() << "\n";
    return 1;
  }

  if (volume >= static_cast<long>(map.volume_count()))
  {
    std::cerr << "--volume=" << volume << " out of range (" << map.volume_count() << " volume(s))\n";
    return 2;
  }
  const int vol_index = static_cast<int>(volume);

  if (json_stdout)
  {
    std::cout << objmap::to_json(map).dump(2) << "\n";
  }
  else
  {
    print_summary(in_path, map, vol_index, opt);
    if (verbose)
      print_objects(map, vol_index);
  }

  std::string err;
  if (!json_path.empty() && !objmap::write_json(json_path, objmap::to_json(map), err))
  {
    std::cerr << "Failed to write " << json_path << ": " << err << "\n";
    return 1;
  }

  if (png_slice >= 0)
  {
    if (png_out.empty())
      png_out = in_path + ".v" + std::to_string(volume) + ".z" + std::to_string(png_slice) + ".png";
    if (!objmap::save_label_slice_png(png_out, map.get_data(vol_index), static_cast<std::size_t>(png_slice), map.objects(), err))
    {
      std::cerr << "Failed to save output: " << err << "\n";
      return 1;
    }
    if (verbose && !json_stdout)
      std::cout << "Wrote " << png_out << "\n";
  }

  return 0;
}
