#pragma once

#include <string>

#include <common/config.hpp>

namespace sc {
    struct GsUri {
        std::string bucket;
        std::string blob;
    };

    // "gs://bucket/a/b.mp4" -> {bucket, "a/b.mp4"}. Throws DownloadError on
    // other schemes.
    GsUri parse_gs_uri(const std::string& uri);

    bool is_gs_uri(const std::string& uri);
    bool is_http_uri(const std::string& uri);

    // Deterministic output location: same bucket/path with a "_cropped"
    // suffix for gs:// inputs, gs://<output_bucket>/<name>_cropped<ext> for
    // http(s) inputs. Throws ConfigurationError when output_bucket is needed
    // but unset.
    std::string output_uri_for_input(const std::string& input_uri, const std::string& output_bucket);

    // gs:// objects live under a locally mounted root
    // (<gs_root>/<bucket>/<blob>); http(s) objects are fetched over HTTP.
    class ObjectStore {
    public:
        explicit ObjectStore(StorageConfig cfg);

        // Throws DownloadError.
        void download(const std::string& uri, const std::string& dst_path) const;
        // Throws DownloadError; only gs:// outputs are writable.
        void upload(const std::string& local_path, const std::string& output_uri) const;

        std::string output_uri_for(const std::string& input_uri) const;
        std::string local_path_for(const GsUri& u) const;

    private:
        void download_http_(const std::string& uri, const std::string& dst_path) const;

        StorageConfig cfg_;
    };
}
