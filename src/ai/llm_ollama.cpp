#include <ai-autobuilder/ai/json_text.hpp>
#include <ai-autobuilder/ai/llm.hpp>
#include <ai-autobuilder/errors.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>

namespace autobuilder::ai {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata){
    auto* out = static_cast<std::string*>(userdata); out->append(ptr, size*nmemb); return size*nmemb;
}

LLMCompletion OllamaLLMClient::complete(const std::string& prompt) {
    std::string endpoint = m_cfg.endpoint.empty() ? "http://localhost:11434/api/generate" : m_cfg.endpoint;
    CURL* curl = curl_easy_init();
    if(!curl) throw BackendError(CURLE_FAILED_INIT, "curl_easy_init failed", "", "ollama");
    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)m_cfg.timeout_seconds);
    struct curl_slist* headers=nullptr; headers=curl_slist_append(headers, "Content-Type: application/json; charset=utf-8");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    // Body per generate API: {"model":"<model>","prompt":"...","stream":false}
    std::ostringstream body; body << "{\"model\":\"" << escape_json(m_cfg.model) << "\",\"prompt\":\"" << escape_json(prompt) << "\",\"stream\":false}";
    std::string b=body.str();
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, b.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)b.size());
    spdlog::debug("POST {} model={} ({} bytes)", endpoint, m_cfg.model, b.size());
    CURLcode res = curl_easy_perform(curl);
    long code=0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(headers); curl_easy_cleanup(curl);
    if(res!=CURLE_OK) throw BackendError((int)res, curl_easy_strerror(res), response, "ollama");
    if(code/100!=2){
        bool found=false; std::string err=extract_string_field(response,"error",found);
        throw BackendError((int)code, found?err:"HTTP "+std::to_string(code), response, "ollama");
    }
    bool found=false;
    std::string text=extract_string_field(response,"response",found);
    if(!found) throw BackendError((int)code, "response field missing", response, "ollama");
    return LLMCompletion{text, "ollama", extract_int_field(response,"prompt_eval_count"), extract_int_field(response,"eval_count")};
}

std::string OllamaLLMClient::describe() const {
    return "ollama " + (m_cfg.endpoint.empty() ? std::string("http://localhost:11434/api/generate") : m_cfg.endpoint) + " model=" + m_cfg.model;
}

} // namespace autobuilder::ai
