#include <agentmem/core/http_client.hpp>
#include <agentmem/core/logger.hpp>
#include <sstream>

namespace agentmem {

Json HttpResponse::json() const {
    try {
        return Json::parse(body);
    } catch (const std::exception& e) {
        LOG_DEBUG("HttpResponse: body is not JSON (%s)", e.what());
        return Json();
    }
}

HttpClient::HttpClient() : curl_(nullptr), timeout_ms_(30000) {
    curl_ = curl_easy_init();
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void HttpClient::set_timeout(long ms) { 
    timeout_ms_ = ms; 
}

HttpResponse HttpClient::post_json(const std::string& url, 
                                   const Json& body,
                                   const std::map<std::string, std::string>& extra_headers) {
    std::map<std::string, std::string> headers = extra_headers;
    headers["Content-Type"] = "application/json";
    return perform_request("POST", url, body.dump(), headers);
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userdata);
    response_body->append(ptr, total);
    return total;
}

size_t HttpClient::header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    std::map<std::string, std::string>* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    
    std::string line(buffer, total);
    
    // Remove trailing \r\n
    while (!line.empty() && (line[line.size() - 1] == '\r' || line[line.size() - 1] == '\n')) {
        line.erase(line.size() - 1);
    }
    
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        
        size_t start = value.find_first_not_of(" \t");
        if (start != std::string::npos) {
            value = value.substr(start);
        }
        
        (*headers)[key] = value;
    }
    
    return total;
}

HttpResponse HttpClient::perform_request(const std::string& method,
                                         const std::string& url,
                                         const std::string& body,
                                         const std::map<std::string, std::string>& headers) {
    HttpResponse resp;
    
    if (!curl_) {
        resp.error = "CURL not initialized";
        return resp;
    }
    
    // Reset curl handle for reuse
    curl_easy_reset(curl_);
    
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    
    if (timeout_ms_ > 0) {
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_ / 2 > 0 ? timeout_ms_ / 2 : timeout_ms_);
    }
    
    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    } else if (method != "GET") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    
    if (!body.empty()) {
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));
    }
    
    struct curl_slist* header_list = nullptr;
    for (std::map<std::string, std::string>::const_iterator it = headers.begin();
         it != headers.end(); ++it) {
        std::string header = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }
    
    std::string response_body;
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    
    std::map<std::string, std::string> response_headers;
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
    
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);
    
    CURLcode res = curl_easy_perform(curl_);
    
    if (header_list) {
        curl_slist_free_all(header_list);
    }
    
    if (res != CURLE_OK) {
        resp.error = curl_easy_strerror(res);
        resp.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        return resp;
    }
    
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status_code);
    
    resp.body = response_body;
    resp.headers = response_headers;
    
    if (resp.status_code < 200 || resp.status_code >= 300) {
        std::ostringstream oss;
        oss << "HTTP " << resp.status_code;
        if (!resp.body.empty()) {
            std::string snippet = resp.body;
            if (snippet.size() > 512) {
                snippet = snippet.substr(0, 512) + "...";
            }
            oss << ": " << snippet;
        }
        resp.error = oss.str();
    }
    
    return resp;
}

} // namespace agentmem
