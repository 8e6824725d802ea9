// include/point_classifier.hpp

#pragma once
#include "../src/core/complex.hpp"
#include "../src/core/point.hpp"
#include "../src/core/errors.hpp"
#include "../src/core/labeled_point.hpp"
#include "../src/core/classification.hpp"
#include "../src/utils/partial_sort.hpp"
#include "../src/utils/random_generator.hpp"
#include "../src/utils/dataset_io.hpp"
#include "../src/config/classifier_config.hpp"
#include "../src/classify/classifier.hpp"
#include "../src/classify/bayes_plug_in.hpp"
#include "../src/classify/k_nearest_neighbor.hpp"
#include "../src/classify/single_layer_perceptron.hpp"
#include "../src/classify/multiclass_perceptron.hpp"
#include "../src/classify/classifier_factory.hpp"
