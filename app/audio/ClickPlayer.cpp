// UTF-8
#include "app/audio/ClickPlayer.h"

#include <algorithm>
#include <cstdint>
#include <cstring>

#include <QAudioDevice>
#include <QAudioFormat>
#include <QAudioSink>
#include <QBuffer>
#include <QMediaDevices>
#include <spdlog/spdlog.h>

namespace {

QByteArray toFloatPcm(const std::vector<float>& samples) {
  QByteArray pcm(static_cast<qsizetype>(samples.size() * sizeof(float)), Qt::Uninitialized);
  std::memcpy(pcm.data(), samples.data(), samples.size() * sizeof(float));
  return pcm;
}

// 设备不支持浮点格式时退回 16 位整型，超出范围的采样只能截断
QByteArray toInt16Pcm(const std::vector<float>& samples) {
  QByteArray pcm(static_cast<qsizetype>(samples.size() * sizeof(std::int16_t)), Qt::Uninitialized);
  auto* out = reinterpret_cast<std::int16_t*>(pcm.data());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const float clamped = std::clamp(samples[i], -1.0f, 1.0f);
    out[i] = static_cast<std::int16_t>(clamped * 32767.0f);
  }
  return pcm;
}

} // namespace

ClickPlayer::ClickPlayer(const std::vector<float>& samples, int sampleRate, QObject* parent)
    : QObject(parent) {
  const QAudioDevice device = QMediaDevices::defaultAudioOutput();
  if (device.isNull()) {
    spdlog::warn("No audio output device available, clicks are disabled");
    return;
  }

  QAudioFormat format;
  format.setSampleRate(sampleRate);
  format.setChannelCount(1);
  format.setSampleFormat(QAudioFormat::Float);
  if (device.isFormatSupported(format)) {
    pcm_ = toFloatPcm(samples);
  } else {
    format.setSampleFormat(QAudioFormat::Int16);
    if (!device.isFormatSupported(format)) {
      spdlog::warn("Audio device {} rejects {} Hz mono output, clicks are disabled",
                   device.description().toStdString(), sampleRate);
      return;
    }
    pcm_ = toInt16Pcm(samples);
  }

  voices_.reserve(kVoiceCount);
  for (std::size_t i = 0; i < kVoiceCount; ++i) {
    Voice voice;
    voice.sink = new QAudioSink(device, format, this);
    voice.buffer = new QBuffer(this);
    voice.buffer->setData(pcm_);
    voice.buffer->open(QIODevice::ReadOnly);
    voices_.push_back(voice);
  }
  available_ = true;
  spdlog::info("Click audio ready on {} ({} samples)", device.description().toStdString(), samples.size());
}

ClickPlayer::~ClickPlayer() {
  for (auto& voice : voices_) {
    voice.sink->stop();
  }
}

void ClickPlayer::play() {
  if (!available_ || voices_.empty()) {
    return;
  }
  Voice& voice = voices_[nextVoice_];
  nextVoice_ = (nextVoice_ + 1) % voices_.size();
  voice.sink->stop();
  voice.buffer->seek(0);
  voice.sink->start(voice.buffer);
}
