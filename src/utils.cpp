#include "utils.h"
#include <fstream>
#include <stdexcept>
#include <sstream>
#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <string>
#include <iostream>

static size_t writeMemoryCallback(void *contents, size_t size, size_t nmemb,
                                  void *userp)
{
    size_t realsize = size * nmemb;
    auto &mem = *static_cast<std::string *>(userp);
    mem.append(static_cast<char *>(contents), realsize);
    return realsize;
}

std::string download(std::string_view url)
{
    std::string result;
    std::string url_str{url};

    curl_global_init(CURL_GLOBAL_ALL);
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_handle{
        curl_easy_init(),
        &curl_easy_cleanup};
    if (!curl_handle)
    {
        curl_global_cleanup();
        throw std::runtime_error("Impossible to initialize libcurl");
    }

    curl_easy_setopt(curl_handle.get(), CURLOPT_VERBOSE, 0L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_URL, url_str.c_str());
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEFUNCTION, writeMemoryCallback);
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEDATA, &result);
    curl_easy_setopt(curl_handle.get(), CURLOPT_USERAGENT, "libcurl-agent/1.0");
    curl_easy_setopt(curl_handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_FAILONERROR, 1L);

    CURLcode res = curl_easy_perform(curl_handle.get());
    curl_handle.reset();
    curl_global_cleanup();

    if (res != CURLE_OK)
        throw std::runtime_error(
            "Impossible to retrieve " +
            url_str +
            " : " +
            curl_easy_strerror(res));
    return result;
}

std::string cat(const std::string &path)
{
    std::ifstream file{path, std::ios::binary};
    if (!file)
        throw std::runtime_error("Impossible to open " + path);
    return cat(file);
}

std::string cat(std::istream &stream)
{
    std::stringstream retval;
    retval << stream.rdbuf();
    return retval.str();
}
