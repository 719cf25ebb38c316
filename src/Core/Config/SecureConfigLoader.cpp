/**
 * @file SecureConfigLoader.cpp
 * @brief Implementation of secure configuration loading
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Config.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>
#include <cerrno>

#include <charconv>
#include <sstream>

namespace ClipGuard::Config {

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

ConfigValue inferValue(const std::string& raw) {
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        return raw.substr(1, raw.size() - 2);
    }
    
    if (raw == "true") return true;
    if (raw == "false") return false;
    
    if (!raw.empty()) {
        int64_t integer = 0;
        const char* first = raw.data();
        const char* last = raw.data() + raw.size();
        auto [ptr, ec] = std::from_chars(first, last, integer);
        if (ec == std::errc() && ptr == last) {
            return integer;
        }
        
        if (raw.find('.') != std::string::npos) {
            char* end = nullptr;
            errno = 0;
            double number = std::strtod(raw.c_str(), &end);
            if (errno == 0 && end == raw.c_str() + raw.size()) {
                return number;
            }
        }
    }
    
    return raw;
}

} // anonymous namespace

class SecureConfigLoader::Impl {
public:
    Options options;
    
    explicit Impl(const Options& opts) : options(opts) {}
    
    Result<std::string> canonicalizePath(const std::string& path) {
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::ConfigFileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
    }
    
    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;  // No restriction
        }
        
        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        
        std::string allowed = allowedResult.value();
        if (allowed.back() != '/') {
            allowed.push_back('/');
        }
        
        // "/etc/clipguard-evil" must not pass for "/etc/clipguard"
        return canonicalPath.compare(0, allowed.length(), allowed) == 0;
    }
    
    Result<ByteBuffer> readFileSecurely(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();
        
        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }
        
        // O_NOFOLLOW rejects a symlink swapped in after canonicalization
        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW);
        if (fd < 0) {
            return ErrorCode::ConfigFileNotFound;
        }
        
        // Size via fstat on the open fd, not the path
        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }
        
        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }
        
        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }
        
        ByteBuffer data(static_cast<size_t>(st.st_size));
        size_t total = 0;
        while (total < data.size()) {
            ssize_t bytesRead = read(fd, data.data() + total, data.size() - total);
            if (bytesRead < 0 && errno == EINTR) {
                continue;
            }
            if (bytesRead <= 0) {
                close(fd);
                return ErrorCode::FileReadError;
            }
            total += static_cast<size_t>(bytesRead);
        }
        close(fd);
        
        return data;
    }
    
    Result<ConfigMap> parseConfig(ByteSpan data) {
        ConfigMap config;
        
        std::istringstream stream(toString(data));
        std::string line;
        
        while (std::getline(stream, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }
            
            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                return ErrorCode::ConfigParseFailed;
            }
            
            std::string key = trim(line.substr(0, pos));
            if (key.empty()) {
                return ErrorCode::ConfigParseFailed;
            }
            
            config[key] = inferValue(trim(line.substr(pos + 1)));
        }
        
        return config;
    }
};

SecureConfigLoader::SecureConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

SecureConfigLoader::~SecureConfigLoader() = default;

Result<ConfigMap> SecureConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFileSecurely(path);
    if (dataResult.isFailure()) {
        return dataResult.error();
    }
    
    return loadFromMemory(dataResult.value());
}

Result<ConfigMap> SecureConfigLoader::loadFromMemory(ByteSpan data) {
    if (data.size() > m_impl->options.max_file_size) {
        return ErrorCode::FileTooLarge;
    }
    return m_impl->parseConfig(data);
}

} // namespace ClipGuard::Config
