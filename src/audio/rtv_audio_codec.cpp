/**
 * @file rtv_audio_codec.cpp
 * @brief rtv - PCM16 / base64 audio transport codec
 */

#include "rtv/audio/rtv_audio_codec.h"

#include <algorithm>
#include <cmath>

#include "rtv/utils/rtv_base64.h"

namespace rtv {

int16_t float_to_pcm16(float sample) {
    if (std::isnan(sample)) return 0;

    double s = std::max(-1.0, std::min(1.0, static_cast<double>(sample)));
    long v = std::lround(s * 32768.0);
    v = std::max(-32768L, std::min(32767L, v));
    return static_cast<int16_t>(v);
}

void encode_pcm16_le(const float* samples, size_t num_samples, std::vector<uint8_t>& out_bytes) {
    out_bytes.resize(num_samples * 2);
    for (size_t i = 0; i < num_samples; ++i) {
        auto v = static_cast<uint16_t>(float_to_pcm16(samples[i]));
        out_bytes[i * 2] = static_cast<uint8_t>(v & 0xFF);
        out_bytes[i * 2 + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    }
}

void decode_pcm16_le(const uint8_t* bytes, size_t num_bytes, std::vector<float>& out_samples) {
    size_t count = num_bytes / 2;
    out_samples.resize(count);
    for (size_t i = 0; i < count; ++i) {
        auto v = static_cast<uint16_t>(bytes[i * 2] | (bytes[i * 2 + 1] << 8));
        out_samples[i] = pcm16_to_float(static_cast<int16_t>(v));
    }
}

// =============================================================================
// AudioEncoder
// =============================================================================

AudioEncoder::AudioEncoder(size_t chunk_samples)
    : chunk_samples_(chunk_samples > 0 ? chunk_samples : kCaptureChunkSamples) {}

void AudioEncoder::encode(const float* samples, size_t num_samples,
                          std::vector<std::string>& out_chunks) {
    size_t offset = 0;
    while (offset < num_samples) {
        size_t n = std::min(chunk_samples_, num_samples - offset);
        out_chunks.push_back(encode_chunk(samples + offset, n));
        offset += n;
    }
}

std::string AudioEncoder::encode_chunk(const float* samples, size_t num_samples) {
    encode_pcm16_le(samples, num_samples, scratch_);
    return base64_encode(scratch_.data(), scratch_.size());
}

// =============================================================================
// AudioDecoder
// =============================================================================

AudioDecoder::AudioDecoder(uint32_t sample_rate) : sample_rate_(sample_rate) {}

rtv_result_t AudioDecoder::decode(const std::string& base64_payload, AudioUnit& out_unit) {
    if (!base64_decode(base64_payload, scratch_) || scratch_.size() < 2) {
        return RTV_ERROR_AUDIO_DECODE;
    }

    out_unit.sequence = next_sequence_++;
    out_unit.sample_rate = sample_rate_;
    decode_pcm16_le(scratch_.data(), scratch_.size(), out_unit.samples);
    return RTV_SUCCESS;
}

void AudioDecoder::reset() {
    next_sequence_ = 0;
}

}  // namespace rtv
