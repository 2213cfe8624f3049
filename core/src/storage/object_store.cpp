#include <storage/object_store.hpp>
#include <common/errors.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include <httplib.h>

namespace sc {
    namespace {
        constexpr const char* kGsScheme = "gs://";

        bool starts_with(const std::string& s, const std::string& prefix) {
            return s.compare(0, prefix.size(), prefix) == 0;
        }

        // splitext on a slash-separated object path
        std::pair<std::string, std::string> split_ext(const std::string& path) {
            const std::string ext = std::filesystem::path(path).extension().string();
            return {path.substr(0, path.size() - ext.size()), ext};
        }

        struct HttpTarget {
            std::string scheme_host_port;
            std::string path;
        };

        HttpTarget split_http_uri(const std::string& uri) {
            const size_t scheme_end = uri.find("://");
            const size_t path_start = uri.find('/', scheme_end + 3);
            HttpTarget t;
            if (path_start == std::string::npos) {
                t.scheme_host_port = uri;
                t.path = "/";
            } else {
                t.scheme_host_port = uri.substr(0, path_start);
                t.path = uri.substr(path_start);
            }
            return t;
        }
    } // namespace

    bool is_gs_uri(const std::string& uri) {
        return starts_with(uri, kGsScheme);
    }

    bool is_http_uri(const std::string& uri) {
        return starts_with(uri, "http://") || starts_with(uri, "https://");
    }

    GsUri parse_gs_uri(const std::string& uri) {
        if (!is_gs_uri(uri)) throw DownloadError("Not a gs:// URI: " + uri);

        const std::string rest = uri.substr(std::char_traits<char>::length(kGsScheme));
        const size_t slash = rest.find('/');
        GsUri u;
        u.bucket = rest.substr(0, slash);
        u.blob = slash == std::string::npos ? std::string() : rest.substr(slash + 1);
        return u;
    }

    std::string output_uri_for_input(const std::string& input_uri, const std::string& output_bucket) {
        if (is_gs_uri(input_uri)) {
            const GsUri u = parse_gs_uri(input_uri);
            const auto [base, ext] = split_ext(u.blob);
            return "gs://" + u.bucket + "/" + base + "_cropped" + (ext.empty() ? ".mp4" : ext);
        }

        // http(s) origins are read-only; results go to the configured bucket
        if (output_bucket.empty()) {
            throw ConfigurationError("HTTP(S) input requires storage.output_bucket to be set for output writes.");
        }
        std::string path = input_uri.substr(0, input_uri.find('?'));
        const size_t scheme_end = path.find("://");
        if (scheme_end != std::string::npos) path = path.substr(scheme_end + 3);
        const size_t last_slash = path.rfind('/');
        // only the host remains when there is no slash: no usable basename
        std::string name = last_slash == std::string::npos ? std::string() : path.substr(last_slash + 1);
        if (name.empty()) name = "video.mp4";

        const auto [base, ext] = split_ext(name);
        return "gs://" + output_bucket + "/" + base + "_cropped" + (ext.empty() ? ".mp4" : ext);
    }

    ObjectStore::ObjectStore(StorageConfig cfg) : cfg_(std::move(cfg)) {}

    std::string ObjectStore::output_uri_for(const std::string& input_uri) const {
        return output_uri_for_input(input_uri, cfg_.output_bucket);
    }

    std::string ObjectStore::local_path_for(const GsUri& u) const {
        namespace fs = std::filesystem;
        if (u.bucket.empty() || u.blob.empty()) {
            throw DownloadError("gs:// URI needs a bucket and an object name");
        }
        const fs::path rel = fs::path(u.bucket) / u.blob;
        for (const auto& part : rel) {
            if (part == "..") throw DownloadError("gs:// object name escapes its bucket: " + u.blob);
        }
        return (fs::path(cfg_.gs_root) / rel).string();
    }

    void ObjectStore::download(const std::string& uri, const std::string& dst_path) const {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::create_directories(fs::path(dst_path).parent_path(), ec);

        if (is_gs_uri(uri)) {
            std::cout << "[Storage](download) gs uri=" << uri << "\n";
            const std::string src = local_path_for(parse_gs_uri(uri));
            fs::copy_file(src, dst_path, fs::copy_options::overwrite_existing, ec);
            if (ec) throw DownloadError("download failed for " + uri + ": " + ec.message());
            return;
        }

        if (is_http_uri(uri)) {
            std::cout << "[Storage](download) http uri=" << uri << "\n";
            download_http_(uri, dst_path);
            return;
        }

        throw DownloadError("Unsupported URI scheme: " + uri);
    }

    void ObjectStore::download_http_(const std::string& uri, const std::string& dst_path) const {
        const HttpTarget target = split_http_uri(uri);

        httplib::Client cli(target.scheme_host_port);
        if (!cli.is_valid()) {
            throw DownloadError("cannot reach " + target.scheme_host_port + " (scheme not supported by this build?)");
        }
        cli.set_follow_location(true);
        cli.set_connection_timeout(30, 0);
        cli.set_read_timeout(cfg_.http_timeout_s, 0);

        std::ofstream out(dst_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) throw DownloadError("cannot write " + dst_path);

        int status = 0;
        auto res = cli.Get(
            target.path,
            [&](const httplib::Response& r) {
                status = r.status;
                return r.status >= 200 && r.status < 300;
            },
            [&](const char* data, size_t len) {
                out.write(data, static_cast<std::streamsize>(len));
                return out.good();
            });

        out.close();
        if (status != 0 && (status < 200 || status >= 300)) {
            throw DownloadError("download failed for " + uri + ": HTTP " + std::to_string(status));
        }
        if (!res) {
            throw DownloadError("download failed for " + uri + ": " + httplib::to_string(res.error()));
        }
        if (!out) throw DownloadError("short write while downloading " + uri);
    }

    void ObjectStore::upload(const std::string& local_path, const std::string& output_uri) const {
        namespace fs = std::filesystem;
        if (!is_gs_uri(output_uri)) throw DownloadError("Output URI must be gs://: " + output_uri);

        std::cout << "[Storage](upload) output_uri=" << output_uri << "\n";
        const fs::path dst = local_path_for(parse_gs_uri(output_uri));

        std::error_code ec;
        fs::create_directories(dst.parent_path(), ec);
        // write-then-rename so readers never see a partial object
        const fs::path tmp = dst.string() + ".part";
        fs::copy_file(local_path, tmp, fs::copy_options::overwrite_existing, ec);
        if (!ec) fs::rename(tmp, dst, ec);
        if (ec) {
            std::error_code ignore;
            fs::remove(tmp, ignore);
            throw DownloadError("upload failed for " + output_uri + ": " + ec.message());
        }
    }
}
