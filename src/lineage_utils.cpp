//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lineage_utils.cpp
// Description: Implementation of hashing, UUID, timestamp and job name helpers.
//===----------------------------------------------------------------------===//

#include "lineage_utils.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace lookml_lineage {

std::string CalculateSHA256(const std::string &str) {
	unsigned char hash[EVP_MAX_MD_SIZE];
	unsigned int hash_len = 0;

	EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
	if (!mdctx) {
		throw std::runtime_error("Failed to create EVP_MD_CTX");
	}

	if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1 ||
	    EVP_DigestUpdate(mdctx, str.c_str(), str.size()) != 1 ||
	    EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
		EVP_MD_CTX_free(mdctx);
		throw std::runtime_error("Failed to compute SHA-256 digest");
	}
	EVP_MD_CTX_free(mdctx);

	std::stringstream ss;
	ss << std::hex << std::setfill('0');
	for (unsigned int i = 0; i < hash_len; i++) {
		ss << std::setw(2) << static_cast<unsigned int>(hash[i]);
	}
	return ss.str();
}

std::string GenerateUUID() {
	// Events are built from several table-function threads
	static std::mutex gen_mutex;
	static std::random_device rd;
	static std::mt19937_64 gen(rd());
	static std::uniform_int_distribution<uint64_t> dis64(0, UINT64_MAX);

	auto now = std::chrono::system_clock::now();
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
	uint64_t timestamp = static_cast<uint64_t>(ms);

	uint64_t rand_a, rand_b, rand_final;
	{
		std::lock_guard<std::mutex> lock(gen_mutex);
		rand_a = dis64(gen);
		rand_b = dis64(gen);
		rand_final = dis64(gen) & 0xFFFFFFFFFFFF;
	}

	// First 48 bits: timestamp in milliseconds
	uint64_t time_hi = (timestamp >> 16) & 0xFFFFFFFF;
	uint64_t time_lo = timestamp & 0xFFFF;

	// Version nibble (7) followed by 12 random bits
	uint64_t version_and_rand = 0x7000 | (rand_a & 0x0FFF);

	// Variant bits (10) followed by 14 random bits
	uint64_t variant_and_rand = 0x8000 | (rand_b & 0x3FFF);

	std::stringstream ss;
	ss << std::hex << std::setfill('0');
	ss << std::setw(8) << time_hi << "-";
	ss << std::setw(4) << time_lo << "-";
	ss << std::setw(4) << version_and_rand << "-";
	ss << std::setw(4) << variant_and_rand << "-";
	ss << std::setw(12) << rand_final;
	return ss.str();
}

std::string GetCurrentISOTime() {
	auto now = duckdb::Timestamp::GetCurrentTimestamp();
	std::string ts = duckdb::Timestamp::ToString(now);
	auto space_pos = ts.find(' ');
	if (space_pos != std::string::npos) {
		ts[space_pos] = 'T';
	}
	ts += "Z";
	return ts;
}

std::string SanitizeJobNamePart(const std::string &str) {
	if (str.empty()) {
		return str;
	}

	std::string result;
	result.reserve(str.size());
	bool last_was_underscore = false;

	// Characters that should be replaced with underscore
	auto is_separator = [](char c) {
		return c == '_' || c == '-' || c == ' ' || c == '.' || c == ',' || c == ';';
	};

	for (char c : str) {
		if (std::isalnum(static_cast<unsigned char>(c))) {
			result += c;
			last_was_underscore = false;
		} else if (is_separator(c) && !last_was_underscore && !result.empty()) {
			result += '_';
			last_was_underscore = true;
		}
	}

	if (!result.empty() && result.back() == '_') {
		result.pop_back();
	}
	return result;
}

std::string GenerateViewJobName(const std::string &view_name, const std::string &definition, size_t max_length) {
	std::string short_hash = CalculateSHA256(definition.empty() ? view_name : definition).substr(0, 8);

	std::string job_name = "VIEW";
	std::string sanitized = SanitizeJobNamePart(view_name);
	// Reserve 9 chars for "_" + 8-char hash
	size_t max_prefix_length = max_length > 9 ? max_length - 9 : 0;
	if (!sanitized.empty()) {
		std::string tentative = job_name + "_" + sanitized;
		if (tentative.length() > max_prefix_length) {
			tentative = tentative.substr(0, max_prefix_length);
		}
		job_name = tentative;
	}

	job_name += "_" + short_hash;
	return job_name;
}

} // namespace lookml_lineage
