#ifndef AGENTMEM_CORE_UTILS_HPP
#define AGENTMEM_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <set>
#include <cstdint>
#include <ctime>

namespace agentmem {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// clamp() that also maps NaN to min_val
double clamp_unit(double value, double min_val = 0.0, double max_val = 1.0);

// Format with a fixed number of decimals ("0.667")
std::string format_fixed(double value, int decimals);

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Case-insensitive substring test; an empty needle always matches
bool contains_ci(const std::string& haystack, const std::string& needle);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Lower-cased runs of alphanumeric characters, in order of appearance
std::vector<std::string> tokenize(const std::string& text);

// Distinct tokens of text
std::set<std::string> token_set(const std::string& text);

// |a ∩ b| / |a ∪ b|; 0 when both are empty
double jaccard(const std::set<std::string>& a, const std::set<std::string>& b);

// ============ Path utilities ============

// Get directory name from path
std::string dirname(const std::string& path);

// Check if path exists
bool path_exists(const std::string& path);

// Check if path is a directory
bool is_directory(const std::string& path);

// Create directory (and parents if needed)
bool mkdir_p(const std::string& path);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Hashing utilities ============

// Compute SHA256 hash as hex string
std::string sha256_hex(const std::string& data);

// 32-bit FNV-1a
uint32_t fnv1a_32(const std::string& data);

} // namespace agentmem

#endif // AGENTMEM_CORE_UTILS_HPP
