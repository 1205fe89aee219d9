#include "emb/MiniLmEmbedder.hpp"
#include <cmath>
#include <iostream>

bool MiniLmEmbedder::init(const std::string& model_path, const std::string& vocab_path) {
    if (!m_tok.load_vocab(vocab_path)) {
        std::cerr << "MiniLmEmbedder: failed to load vocab (or missing [CLS]/[SEP]/[UNK]): " << vocab_path << "\n";
        return false;
    }

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

#ifdef _WIN32
        std::wstring wmodel(model_path.begin(), model_path.end());
        m_session = std::make_unique<Ort::Session>(m_env, wmodel.c_str(), m_opts);
#else
        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        auto out0 = m_session->GetOutputNameAllocated(0, allocator);
        m_out_name = out0.get();

        // exports differ in input order, and some drop token_type_ids
        m_input_count = m_session->GetInputCount();
        if (m_input_count < 2 || m_input_count > 3) {
            std::cerr << "MiniLmEmbedder: unexpected input count " << m_input_count << "\n";
            m_session.reset();
            return false;
        }
        for (size_t i = 0; i < m_input_count; ++i) {
            auto name = m_session->GetInputNameAllocated(i, allocator);
            const std::string n = name.get();
            if (n.find("mask") != std::string::npos) m_in_mask = n;
            else if (n.find("type") != std::string::npos) m_in_type = n;
            else m_in_ids = n;
        }

        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder ORT exception: " << e.what() << "\n";
        std::cerr << "model_path=" << model_path << "\n";
        m_session.reset();
        return false;
    }
}

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    if (!m_session) return {};

    TokenEncoding enc = m_tok.encode(text, m_max_len);
    const size_t seq_len = enc.size();

    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<const char*> in_names;
    std::vector<Ort::Value> in_vals;
    in_names.push_back(m_in_ids.c_str());
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, enc.input_ids.data(), seq_len, shape.data(), shape.size()));
    in_names.push_back(m_in_mask.c_str());
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, enc.attention_mask.data(), seq_len, shape.data(), shape.size()));
    if (m_input_count == 3) {
        in_names.push_back(m_in_type.c_str());
        in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, enc.token_type_ids.data(), seq_len, shape.data(), shape.size()));
    }

    const char* out_names[1] = { m_out_name.c_str() };

    std::vector<Ort::Value> outs;
    try {
        outs = m_session->Run(Ort::RunOptions{nullptr}, in_names.data(), in_vals.data(), in_vals.size(), out_names, 1);
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder: inference failed: " << e.what() << "\n";
        return {};
    }

    Ort::Value& out = outs[0];
    auto shp = out.GetTensorTypeAndShapeInfo().GetShape(); // [1, seq_len, hidden]
    if (shp.size() != 3 || shp[1] != (int64_t)seq_len) return {};

    const size_t hidden = (size_t)shp[2];
    const float* data = out.GetTensorData<float>();

    std::vector<float> pooled(hidden, 0.0f);
    double denom = 0.0;

    for (size_t t = 0; t < seq_len; ++t) {
        if (enc.attention_mask[t] == 0) continue;
        denom += 1.0;
        const float* row = data + t * hidden;
        for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
    }

    if (denom > 0.0) {
        float inv = (float)(1.0 / denom);
        for (float& x : pooled) x *= inv;
    }

    l2_normalize(pooled);
    return pooled;
}
