// UTF-8
#pragma once

#include <cstddef>
#include <vector>

#include <QByteArray>
#include <QObject>

class QAudioSink;
class QBuffer;

/**
 * 点击音播放器：启动时接收预先合成的波形，每次 play() 复用同一份数据。
 * 内部轮换多个 QAudioSink，快速连续触发时声音可以重叠，play() 不会阻塞调用方。
 * 没有可用的音频输出设备时静默降级，只记录一次日志。
 */
class ClickPlayer : public QObject {
  Q_OBJECT
public:
  ClickPlayer(const std::vector<float>& samples, int sampleRate, QObject* parent = nullptr);
  ~ClickPlayer() override;

  bool isAvailable() const { return available_; }

  /// 立即播放一次点击音（即发即忘）。
  void play();

private:
  struct Voice {
    QAudioSink* sink{};
    QBuffer* buffer{};
  };

  static constexpr std::size_t kVoiceCount = 8;

  QByteArray pcm_;
  std::vector<Voice> voices_;
  std::size_t nextVoice_{0};
  bool available_{false};
};
