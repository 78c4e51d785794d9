#pragma once

#include <atomic>
#include <chrono>
#include <core/model/security_context.h>
#include <core/security/certificate.h>
#include <core/security/certificate_manager.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace peerpin::test {

// Unique directory under the system temp dir, removed with everything in it.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path()
                / ("peerpin_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path Write(const std::string& name, const std::string& content) const {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot write " + file.string());
        }
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

// Routes the default logger into a string for its lifetime, "<level> <message>" per line.
class CapturedLog {
public:
    CapturedLog()
        : previous_(spdlog::default_logger()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_, true);
        sink->set_pattern("%l %v");
        auto logger = std::make_shared<spdlog::logger>("captured", std::move(sink));
        logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(std::move(logger));
    }

    ~CapturedLog() { spdlog::set_default_logger(previous_); }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    std::string str() const { return stream_.str(); }

    bool Contains(const std::string& text) const {
        return stream_.str().find(text) != std::string::npos;
    }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> previous_;
};

inline core::SecurityContext MakeIdentity(const std::string& common_name) {
    core::CertificateSubject subject;
    subject.common_name = common_name;
    return core::CertificateManager::GenerateSelfSigned(subject);
}

inline core::SecurityContext MakeServerIdentity(const std::string& common_name = "localhost") {
    core::CertificateSubject subject;
    subject.common_name = common_name;
    subject.dns_names = {common_name};
    subject.ip_addresses = {"127.0.0.1"};
    return core::CertificateManager::GenerateSelfSigned(subject);
}

inline core::Certificate CertificateOf(const core::SecurityContext& identity) {
    auto certificate = core::Certificate::FromPem(identity.certificate_pem);
    if (!certificate) {
        throw std::runtime_error("generated certificate does not parse");
    }
    return *certificate;
}

inline core::DerBytes DerOf(const core::SecurityContext& identity) {
    return CertificateOf(identity).der();
}

} // namespace peerpin::test
