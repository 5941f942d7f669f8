#ifndef AGENTMEM_CORE_HTTP_CLIENT_HPP
#define AGENTMEM_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <map>
#include <curl/curl.h>

namespace agentmem {

// HTTP response structure
struct HttpResponse {
    long status_code;
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;
    bool timed_out;
    
    HttpResponse() : status_code(0), timed_out(false) {}
    
    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
    
    // Parsed body; null Json when the body is not valid JSON
    Json json() const;
};

// Blocking HTTP client using libcurl. One instance per thread.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();
    
    void set_timeout(long ms);
    
    // POST request with JSON body
    HttpResponse post_json(const std::string& url, 
                           const Json& body,
                           const std::map<std::string, std::string>& extra_headers = std::map<std::string, std::string>());

private:
    CURL* curl_;
    long timeout_ms_;
    
    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);
    
    HttpResponse perform_request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::map<std::string, std::string>& headers);
    
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace agentmem

#endif // AGENTMEM_CORE_HTTP_CLIENT_HPP
