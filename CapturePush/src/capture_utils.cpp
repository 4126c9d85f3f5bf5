#include "capturepush/capture_utils.hpp"
#include "capturepush/constants.hpp"
#include "capturepush/generic_exception.hpp"

#include <ctype.h>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/hmac.h>

static std::string errnoDescription(std::string action, std::string path) {
    return action + " " + path + " failed: " + strerror(errno);
}

std::string CaptureUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

std::string CaptureUtils::toBase64(const unsigned char * pbegin, size_t len) {
    std::vector<unsigned char> out(4 * ((len + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), pbegin, (int)len);
    return std::string((char *)out.data(), n);
}

std::string CaptureUtils::toHex(const unsigned char * pbegin, size_t len) {
    static const char * digits = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t ii = 0; ii < len; ii ++) {
        result.push_back(digits[pbegin[ii] >> 4]);
        result.push_back(digits[pbegin[ii] & 0x0F]);
    }
    return result;
}

std::string CaptureUtils::sha256Hex(const std::string & data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;

    EVP_MD_CTX * ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw GenericException("OpenSSL: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, out, &outLen) != 1) {
        EVP_MD_CTX_free(ctx);
        throw GenericException("OpenSSL: SHA-256 digest failed");
    }
    EVP_MD_CTX_free(ctx);
    return toHex(out, outLen);
}

std::string CaptureUtils::hmacSHA256(const std::string & key, const std::string & data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (HMAC(EVP_sha256(), key.data(), (int)key.size(), (const unsigned char *)data.data(), data.size(), out, &outLen) == nullptr) {
        throw GenericException("OpenSSL: HMAC-SHA256 failed");
    }
    return std::string((char *)out, outLen);
}

std::string CaptureUtils::normalizeWhitespace(const std::string & str) {
    std::string result;
    result.reserve(str.size());
    bool pendingSpace = false;
    for (char c : str) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            pendingSpace = result.size() > 0;
            continue;
        }
        if (pendingSpace) {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(c);
    }
    return result;
}

std::string CaptureUtils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

std::string CaptureUtils::escapePathComponent(const std::string & str) {
    // percent-encoding keeps distinct account keys mapped to distinct files
    static const char * digits = "0123456789ABCDEF";
    std::string result;
    for (unsigned char c : str) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.') {
            result.push_back(c);
        } else {
            result.push_back('%');
            result.push_back(digits[c >> 4]);
            result.push_back(digits[c & 0x0F]);
        }
    }
    if (result == "." || result == "..") {
        result = "%2E" + result.substr(1);
    }
    return result;
}

std::string CaptureUtils::localTimestampForTime(time_t time) {
    struct tm ptm;
    localtime_r(&time, &ptm);
    char buffer[32];
    strftime(buffer, 32, "%Y-%m-%d %H:%M:%S", &ptm);
    return std::string(buffer);
}

bool CaptureUtils::parseISODate(const std::string & str, time_t & out) {
    int year = 0, month = 0, day = 0;
    char trailing = 0;
    if (sscanf(str.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &trailing) != 3) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return false;
    }
    struct tm ptm = {};
    ptm.tm_year = year - 1900;
    ptm.tm_mon = month - 1;
    ptm.tm_mday = day;
    out = timegm(&ptm);
    // timegm normalizes dates like 02-31; reject them
    struct tm check;
    gmtime_r(&out, &check);
    return check.tm_mday == day && check.tm_mon == month - 1;
}

std::string CaptureUtils::formatISODate(time_t time) {
    struct tm ptm;
    gmtime_r(&time, &ptm);
    char buffer[16];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d", &ptm);
    return std::string(buffer);
}

bool CaptureUtils::fileExists(std::string path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

bool CaptureUtils::isDirectory(std::string path) {
    struct stat buffer;
    if (stat(path.c_str(), &buffer) != 0) {
        return false;
    }
    return S_ISDIR(buffer.st_mode);
}

void CaptureUtils::makeDirectories(std::string path) {
    if (path == "" || isDirectory(path)) {
        return;
    }
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos && pos > 0) {
        makeDirectories(path.substr(0, pos));
    }
    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        throw GenericException(errnoDescription("mkdir", path));
    }
}

static int _removeTreeEntry(const char * fpath, const struct stat * sb, int typeflag, struct FTW * ftwbuf) {
    return remove(fpath);
}

void CaptureUtils::removeTree(std::string path) {
    if (!fileExists(path)) {
        return;
    }
    if (nftw(path.c_str(), _removeTreeEntry, 16, FTW_DEPTH | FTW_PHYS) != 0) {
        throw GenericException(errnoDescription("remove", path));
    }
}

void CaptureUtils::renamePath(std::string from, std::string to) {
    if (rename(from.c_str(), to.c_str()) != 0) {
        throw GenericException(errnoDescription("rename to " + to + ":", from));
    }
}

std::vector<std::string> CaptureUtils::listDirectory(std::string path) {
    std::vector<std::string> results;
    DIR * dir = opendir(path.c_str());
    if (dir == nullptr) {
        return results;
    }
    struct dirent * entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        results.push_back(name);
    }
    closedir(dir);
    std::sort(results.begin(), results.end());
    return results;
}

std::string CaptureUtils::readFile(std::string path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.good()) {
        throw GenericException(errnoDescription("open", path));
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

void CaptureUtils::writeFile(std::string path, const std::string & contents) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw GenericException(errnoDescription("open", path));
    }
    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = write(fd, contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string err = errnoDescription("write", path);
            close(fd);
            throw GenericException(err);
        }
        written += (size_t)n;
    }
    if (fsync(fd) != 0) {
        std::string err = errnoDescription("fsync", path);
        close(fd);
        throw GenericException(err);
    }
    close(fd);
}

void CaptureUtils::writeFileAtomically(std::string path, const std::string & contents) {
    // readers either see the old file or the complete new one, never a partial write
    static std::atomic<unsigned int> counter { 0 };
    std::string tmp = path + ".tmp-" + std::to_string(getpid()) + "-" + std::to_string(counter++);
    try {
        writeFile(tmp, contents);
        renamePath(tmp, path);
    } catch (GenericException & ex) {
        unlink(tmp.c_str());
        throw;
    }
}
