/**
 * @file rtv_audio_codec.h
 * @brief rtv - PCM16 / base64 audio transport codec
 *
 * Capture path: float samples in [-1, 1] -> PCM16 little-endian -> base64.
 * Playback path: base64 -> PCM16 little-endian -> float AudioUnit.
 */

#ifndef RTV_AUDIO_CODEC_H
#define RTV_AUDIO_CODEC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "rtv/core/rtv_error.h"
#include "rtv/core/rtv_types.h"

namespace rtv {

/**
 * @brief One decoded chunk of playback audio (mono, float samples)
 */
struct AudioUnit {
    uint64_t sequence = 0;
    uint32_t sample_rate = kRealtimeSampleRate;
    std::vector<float> samples;

    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

// =============================================================================
// Sample conversion
// =============================================================================

/**
 * @brief Convert one sample to PCM16, clamping to [-1, 1] first
 *
 * NaN maps to silence.
 */
int16_t float_to_pcm16(float sample);

inline float pcm16_to_float(int16_t sample) {
    return static_cast<float>(sample) / 32768.0f;
}

void encode_pcm16_le(const float* samples, size_t num_samples, std::vector<uint8_t>& out_bytes);

/**
 * @brief Decode little-endian PCM16 bytes; a trailing odd byte is ignored
 */
void decode_pcm16_le(const uint8_t* bytes, size_t num_bytes, std::vector<float>& out_samples);

// =============================================================================
// AudioEncoder (capture path)
// =============================================================================

class AudioEncoder {
public:
    explicit AudioEncoder(size_t chunk_samples = kCaptureChunkSamples);

    /**
     * @brief Encode one chunk of float samples into base64 PCM16 text
     *
     * Chunks longer than chunk_samples() are split; every resulting piece is
     * appended to out_chunks in order.
     */
    void encode(const float* samples, size_t num_samples, std::vector<std::string>& out_chunks);

    std::string encode_chunk(const float* samples, size_t num_samples);

    size_t chunk_samples() const { return chunk_samples_; }

private:
    size_t chunk_samples_;
    std::vector<uint8_t> scratch_;
};

// =============================================================================
// AudioDecoder (playback path)
// =============================================================================

class AudioDecoder {
public:
    explicit AudioDecoder(uint32_t sample_rate = kRealtimeSampleRate);

    /**
     * @brief Decode one audio-delta payload into an AudioUnit
     *
     * Each successful decode consumes the next arrival sequence number.
     *
     * @return RTV_ERROR_AUDIO_DECODE if the payload is not valid base64 or
     *         contains no complete sample
     */
    rtv_result_t decode(const std::string& base64_payload, AudioUnit& out_unit);

    // Restart sequence numbering (new session)
    void reset();

    uint64_t next_sequence() const { return next_sequence_; }

private:
    uint32_t sample_rate_;
    uint64_t next_sequence_ = 0;
    std::vector<uint8_t> scratch_;
};

}  // namespace rtv

#endif  // RTV_AUDIO_CODEC_H
