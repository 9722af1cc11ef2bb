#pragma once

/**
 * @brief 流量采样来源（超声波 TOF 测量驱动的抽象）
 * 返回瞬时流量，单位 L/min，逆流为负。
 */
class FlowSource {
public:
    virtual ~FlowSource() = default;
    virtual float sampleLpm() = 0;
};

/** 主机仿真：恒定流量 */
class SimulatedFlowSource : public FlowSource {
private:
    float lpm_;

public:
    explicit SimulatedFlowSource(float lpm) : lpm_(lpm) {}

    float sampleLpm() override { return lpm_; }
};
