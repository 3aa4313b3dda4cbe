#include "exifnote/build_info.h"
#include "exifnote/console_format.h"
#include "exifnote/exif_codec.h"
#include "exifnote/metadata_reader.h"
#include "exifnote/stamp.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace exifnote {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::span<const std::byte> bytes_view(const nb::bytes& data)
    {
        return { reinterpret_cast<const std::byte*>(data.data()),
                 data.size() };
    }


    static nb::tuple extract(nb::bytes data, uint64_t window_bytes)
    {
        ExtractOptions options;
        options.header_window_bytes = window_bytes;

        ExtractResult res;
        {
            nb::gil_scoped_release gil_release;
            JpegExifCodec codec;
            res = extract_exif_summary_checked(bytes_view(data), codec,
                                               options);
        }
        return nb::make_tuple(res.status, res.summary.date_taken,
                              res.summary.original_file_name);
    }


    static nb::tuple stamp(nb::bytes data, const std::string& file_name)
    {
        std::vector<std::byte> out;
        StampResult res;
        {
            nb::gil_scoped_release gil_release;
            JpegExifCodec codec;
            res = stamp_original_filename(bytes_view(data), file_name, codec,
                                          &out);
        }
        if (res.status != StampStatus::Stamped) {
            return nb::make_tuple(res.status, data);
        }
        nb::bytes b(reinterpret_cast<const char*>(out.data()), out.size());
        return nb::make_tuple(res.status, b);
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(build_info(), &line1, &line2);
        return { std::move(line1), std::move(line2) };
    }

}  // namespace
}  // namespace exifnote

NB_MODULE(_exifnote, m)
{
    using namespace exifnote;

    m.doc()               = "exifnote: EXIF capture date and original filename.";
    m.attr("__version__") = sv_to_py(build_info().version);

    nb::enum_<ExtractStatus>(m, "ExtractStatus")
        .value("Ok", ExtractStatus::Ok)
        .value("ReadFailed", ExtractStatus::ReadFailed)
        .value("Unsupported", ExtractStatus::Unsupported)
        .value("Malformed", ExtractStatus::Malformed)
        .value("LimitExceeded", ExtractStatus::LimitExceeded);

    nb::enum_<StampStatus>(m, "StampStatus")
        .value("Stamped", StampStatus::Stamped)
        .value("Unchanged", StampStatus::Unchanged)
        .value("ParseFailed", StampStatus::ParseFailed)
        .value("DumpFailed", StampStatus::DumpFailed)
        .value("InsertFailed", StampStatus::InsertFailed);

    m.def("extract", &extract, "data"_a, "window_bytes"_a = 65536U,
          "Returns (status, date_taken, original_file_name).");
    m.def("stamp", &stamp, "data"_a, "file_name"_a,
          "Returns (status, bytes); bytes are the input unless stamped.");
    m.def(
        "console_text",
        [](nb::bytes data, uint32_t max_bytes) {
            const std::string_view s(data.c_str(), data.size());
            return console_escaped(s, max_bytes);
        },
        "data"_a, "max_bytes"_a = 4096U);

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]              = sv_to_py(bi.version);
        d["build_timestamp_utc"]  = sv_to_py(bi.build_timestamp_utc);
        d["build_type"]           = sv_to_py(bi.build_type);
        d["system_name"]          = sv_to_py(bi.system_name);
        d["system_processor"]     = sv_to_py(bi.system_processor);
        d["cxx_compiler_id"]      = sv_to_py(bi.cxx_compiler_id);
        d["cxx_compiler_version"] = sv_to_py(bi.cxx_compiler_version);
        return d;
    });
    m.def("info", &info_lines);
}
