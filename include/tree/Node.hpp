#pragma once

#include <memory>
#include <cstddef>

struct Node {
    bool   isLeaf  = false;
    size_t samples = 0;
    double gain    = 0.0;      // split gain, 0 for leaves

    int    featureIndex = -1;
    double threshold    = 0.0;
    double prediction   = 0.0; // leaf weight

    std::unique_ptr<Node> leftChild  = nullptr;
    std::unique_ptr<Node> rightChild = nullptr;

    // Make this node a leaf
    void makeLeaf(double value) {
        isLeaf = true;
        prediction = value;
        featureIndex = -1;
        threshold = 0.0;
        leftChild.reset();
        rightChild.reset();
    }

    // Make this node an internal node; children are attached by the caller
    void makeInternal(int feature, double splitThreshold, double splitGain) {
        isLeaf = false;
        featureIndex = feature;
        threshold = splitThreshold;
        gain = splitGain;
    }

    int getFeatureIndex() const { return isLeaf ? -1 : featureIndex; }
    double getThreshold() const { return isLeaf ? 0.0 : threshold; }
    double getPrediction() const { return isLeaf ? prediction : 0.0; }
    Node* getLeft() const { return isLeaf ? nullptr : leftChild.get(); }
    Node* getRight() const { return isLeaf ? nullptr : rightChild.get(); }
};
