//
//  transcription_gateway_test.cpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#include <memory>

#include "test_helpers.hpp"
#include "transcription_gateway.hpp"

using namespace std::chrono_literals;

/* recognizer honouring the deadline the way whisper's abort callback does */
class SlowRecognizer : public Recognizer {
public:
  RecognitionResult transcribe(const std::string &,
                               const RecognitionOptions &options) override {
    while (!options.deadline ||
           std::chrono::steady_clock::now() < *options.deadline) {
      std::this_thread::sleep_for(10ms);
    }
    throw GatewayError(ErrorKind::recognition_timeout, "aborted");
  }
};

struct Fixture {
  TempDir tmp;
  std::shared_ptr<FakeRecognizer> fake{std::make_shared<FakeRecognizer>()};
  std::string audio;

  Fixture() {
    audio = (tmp.path() / "audio.wav").string();
    write_file(audio, "RIFF....WAVE");
  }
};

void testSuccess() {
  Fixture f;
  TranscriptionGateway gateway(f.fake, 600s);
  auto result = gateway.transcribe(f.audio, std::string("Kubernetes"));
  assert(result.text == FakeRecognizer::sample().text);
  assert(f.fake->calls == 1);
  assert(f.fake->last_path == f.audio);
  assert(*f.fake->last_options.hotword == "Kubernetes");
  assert(f.fake->last_options.deadline);
  assert(!f.fake->last_options.enable_spk);
}

void testNoTimeoutNoDeadline() {
  Fixture f;
  TranscriptionGateway gateway(f.fake, 0s);
  gateway.transcribe(f.audio, std::nullopt);
  assert(!f.fake->last_options.deadline);
  assert(!f.fake->last_options.hotword);
}

void testEmptyPromptIsNoHotword() {
  Fixture f;
  TranscriptionGateway gateway(f.fake, 600s);
  gateway.transcribe(f.audio, std::string());
  assert(!f.fake->last_options.hotword);
}

void testFailureIsWrapped() {
  Fixture f;
  f.fake->failure = "model exploded";
  TranscriptionGateway gateway(f.fake, 600s);
  try {
    gateway.transcribe(f.audio, std::nullopt);
    assert(false);
  } catch (const GatewayError &e) {
    assert(e.kind() == ErrorKind::recognition_failure);
    assert(std::string(e.what()) ==
           "An error occurred during transcription: model exploded");
  }
}

void testEmptyResultIsFailure() {
  Fixture f;
  f.fake->result = RecognitionResult{};
  TranscriptionGateway gateway(f.fake, 600s);
  assert(throws_kind([&] { gateway.transcribe(f.audio, std::nullopt); },
                     ErrorKind::recognition_failure));
}

void testDeadlineOverrun() {
  Fixture f;
  TranscriptionGateway gateway(std::make_shared<SlowRecognizer>(), 1s);
  auto start = std::chrono::steady_clock::now();
  try {
    gateway.transcribe(f.audio, std::nullopt);
    assert(false);
  } catch (const GatewayError &e) {
    assert(e.kind() == ErrorKind::recognition_timeout);
    assert(std::string(e.what()) == "Transcription timed out");
  }
  assert(std::chrono::steady_clock::now() - start < 10s);
}

void testFailureAfterDeadlineIsTimeout() {
  Fixture f;
  f.fake->failure = "interrupted";
  f.fake->delay = 1500ms;
  TranscriptionGateway gateway(f.fake, 1s);
  assert(throws_kind([&] { gateway.transcribe(f.audio, std::nullopt); },
                     ErrorKind::recognition_timeout));
}

void testLateSuccessIsKept() {
  Fixture f;
  f.fake->delay = 1500ms;
  TranscriptionGateway gateway(f.fake, 1s);
  auto result = gateway.transcribe(f.audio, std::nullopt);
  assert(!result.empty());
}

void testDiarizationFlowsThrough() {
  Fixture f;
  f.fake->diarization = true;
  TranscriptionGateway gateway(f.fake, 600s);
  auto result = gateway.transcribe(f.audio, std::nullopt);
  assert(f.fake->last_options.enable_spk);

  auto body = gateway.render(result, ResponseFormat::verbose_json);
  auto j = nlohmann::json::parse(body.body);
  assert(j["segments"][1]["speaker_turn"] == true);
}

int main() {
  testSuccess();
  testNoTimeoutNoDeadline();
  testEmptyPromptIsNoHotword();
  testFailureIsWrapped();
  testEmptyResultIsFailure();
  testDeadlineOverrun();
  testFailureAfterDeadlineIsTimeout();
  testLateSuccessIsKept();
  testDiarizationFlowsThrough();
  std::cout << "transcription_gateway_test: all tests passed\n";
  return 0;
}
