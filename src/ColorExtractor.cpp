#include "ColorExtractor.hpp"
#include "PipelineError.hpp"

namespace
{
constexpr int K_HIST_BITS = 4;
constexpr int K_BINS_PER_AXIS = 1 << K_HIST_BITS;
constexpr int K_HIST_SIZE = K_BINS_PER_AXIS * K_BINS_PER_AXIS * K_BINS_PER_AXIS;

inline double squaredDistance(const Centroid &a, const Centroid &b)
{
    const double dr = a.r - b.r;
    const double dg = a.g - b.g;
    const double db = a.b - b.b;
    return dr * dr + dg * dg + db * db;
}

// 距离相同的情况下取编号较小的中心
inline size_t nearest(const Centroid &p, const std::vector<Centroid> &centroids)
{
    size_t best = 0;
    double bestDist = squaredDistance(p, centroids[0]);
    for (size_t k = 1; k < centroids.size(); ++k)
    {
        double d = squaredDistance(p, centroids[k]);
        if (d < bestDist)
        {
            bestDist = d;
            best = k;
        }
    }
    return best;
}

inline int histogramBin(const Centroid &p)
{
    const int r = static_cast<int>(p.r) >> (8 - K_HIST_BITS);
    const int g = static_cast<int>(p.g) >> (8 - K_HIST_BITS);
    const int b = static_cast<int>(p.b) >> (8 - K_HIST_BITS);
    return (r * K_BINS_PER_AXIS + g) * K_BINS_PER_AXIS + b;
}

// 计数多者优先，相同时先扫描到的优先
inline bool dominates(const ClusterAccumulator &a, const ClusterAccumulator &b)
{
    if (a.pixelCount != b.pixelCount)
        return a.pixelCount > b.pixelCount;
    return a.firstPixel < b.firstPixel;
}

std::vector<Centroid> meansOf(const std::vector<ClusterAccumulator> &clusters)
{
    std::vector<Centroid> centroids;
    centroids.reserve(clusters.size());
    for (const auto &c : clusters)
        centroids.push_back(c.mean());
    return centroids;
}

Centroid asCentroid(const Rgb &c)
{
    return Centroid{static_cast<double>(c.r), static_cast<double>(c.g), static_cast<double>(c.b)};
}
} // namespace

ColorExtractor::ColorExtractor(const ExtractorOptions &options)
    : m_options(options)
{
}

// ---------------------------------------------------------------
// Euclidean RGB distance
// ---------------------------------------------------------------
double ColorExtractor::colorDistance(const Centroid &c1, const Centroid &c2)
{
    return std::sqrt(squaredDistance(c1, c2));
}

double ColorExtractor::colorDistance(const Rgb &c1, const Rgb &c2)
{
    return colorDistance(asCentroid(c1), asCentroid(c2));
}

size_t ColorExtractor::noiseFloor(size_t population) const
{
    const double floor = std::ceil(m_options.minClusterFraction * static_cast<double>(population));
    return std::max<size_t>(1, static_cast<size_t>(floor));
}

// ---------------------------------------------------------------
// Deterministic stride sampling for very large rasters
// ---------------------------------------------------------------
std::vector<Centroid> ColorExtractor::samplePixels(const RasterImage &image) const
{
    const size_t total = image.pixelCount();
    const size_t stride = (total + m_options.maxSamples - 1) / m_options.maxSamples;

    std::vector<Centroid> samples;
    samples.reserve(total / stride + 1);

    const std::uint8_t *data = image.data();
    for (size_t i = 0; i < total; i += stride)
    {
        const std::uint8_t *p = data + i * RasterImage::kChannels;
        samples.push_back(Centroid{static_cast<double>(p[0]), static_cast<double>(p[1]), static_cast<double>(p[2])});
    }
    return samples;
}

// ---------------------------------------------------------------
// Histogram peaks -> initial centroids
// ---------------------------------------------------------------
std::vector<Centroid> ColorExtractor::seedFromHistogram(const std::vector<Centroid> &samples) const
{
    std::vector<ClusterAccumulator> bins(K_HIST_SIZE);
    for (size_t i = 0; i < samples.size(); ++i)
        bins[histogramBin(samples[i])].add(samples[i], i);

    const size_t floor = noiseFloor(samples.size());

    auto isPeak = [&](int bin)
    {
        const int r = bin / (K_BINS_PER_AXIS * K_BINS_PER_AXIS);
        const int g = (bin / K_BINS_PER_AXIS) % K_BINS_PER_AXIS;
        const int b = bin % K_BINS_PER_AXIS;
        const size_t count = bins[bin].pixelCount;

        for (int dr = -1; dr <= 1; ++dr)
            for (int dg = -1; dg <= 1; ++dg)
                for (int db = -1; db <= 1; ++db)
                {
                    if (dr == 0 && dg == 0 && db == 0)
                        continue;
                    const int nr = r + dr, ng = g + dg, nb = b + db;
                    if (nr < 0 || ng < 0 || nb < 0 || nr >= K_BINS_PER_AXIS || ng >= K_BINS_PER_AXIS || nb >= K_BINS_PER_AXIS)
                        continue;
                    const int neighbour = (nr * K_BINS_PER_AXIS + ng) * K_BINS_PER_AXIS + nb;
                    const size_t other = bins[neighbour].pixelCount;
                    // 平台区只保留编号最小的那个 bin
                    if (other > count || (other == count && neighbour < bin))
                        return false;
                }
        return true;
    };

    std::vector<ClusterAccumulator> peaks;
    for (int bin = 0; bin < K_HIST_SIZE; ++bin)
    {
        if (bins[bin].pixelCount >= floor && isPeak(bin))
            peaks.push_back(bins[bin]);
    }

    // 没有任何 bin 超过噪声阈值 (颜色极其分散)：退化为最大的 bin
    if (peaks.empty())
    {
        auto best = std::ranges::min_element(bins, dominates);
        peaks.push_back(*best);
    }

    std::ranges::sort(peaks, dominates);
    if (peaks.size() > static_cast<size_t>(m_options.maxClusters))
        peaks.resize(m_options.maxClusters);

    spdlog::debug("[ColorExtractor] {} histogram peaks -> initial K = {}", peaks.size(), peaks.size());
    return meansOf(peaks);
}

// ---------------------------------------------------------------
// Merge centroids closer than the perceptual threshold
// ---------------------------------------------------------------
bool ColorExtractor::mergeClose(std::vector<ClusterAccumulator> &clusters, bool onRoundedColors) const
{
    auto distance = [&](const ClusterAccumulator &a, const ClusterAccumulator &b)
    {
        if (onRoundedColors)
            return colorDistance(a.toColor(), b.toColor());
        return colorDistance(a.mean(), b.mean());
    };

    bool merged = false;
    while (clusters.size() > 1)
    {
        size_t bestI = 0, bestJ = 0;
        double bestDist = std::numeric_limits<double>::max();
        for (size_t i = 0; i < clusters.size(); ++i)
            for (size_t j = i + 1; j < clusters.size(); ++j)
            {
                double d = distance(clusters[i], clusters[j]);
                if (d < bestDist)
                {
                    bestDist = d;
                    bestI = i;
                    bestJ = j;
                }
            }

        if (bestDist >= m_options.mergeThreshold)
            break;

        clusters[bestI].absorb(clusters[bestJ]);
        clusters.erase(clusters.begin() + static_cast<std::ptrdiff_t>(bestJ));
        merged = true;
    }
    return merged;
}

// ---------------------------------------------------------------
// Discard noise clusters (never the last one)
// ---------------------------------------------------------------
bool ColorExtractor::dropNoise(std::vector<ClusterAccumulator> &clusters, size_t population) const
{
    if (clusters.size() <= 1)
        return false;

    const size_t floor = noiseFloor(population);
    auto isNoise = [floor](const ClusterAccumulator &c)
    {
        return c.pixelCount < floor;
    };

    if (std::ranges::all_of(clusters, isNoise))
    {
        ClusterAccumulator keep = *std::ranges::min_element(clusters, dominates);
        clusters.assign(1, keep);
        return true;
    }

    return std::erase_if(clusters, isNoise) > 0;
}

// ---------------------------------------------------------------
// k-means iterations on the sample
// ---------------------------------------------------------------
std::vector<Centroid> ColorExtractor::refine(const std::vector<Centroid> &samples, std::vector<Centroid> centroids) const
{
    std::vector<std::ptrdiff_t> labels(samples.size(), -1);

    for (int it = 0; it < m_options.maxIterations; ++it)
    {
        bool changed = false;
        std::vector<ClusterAccumulator> clusters(centroids.size());

        for (size_t i = 0; i < samples.size(); ++i)
        {
            const size_t k = nearest(samples[i], centroids);
            if (labels[i] != static_cast<std::ptrdiff_t>(k))
            {
                labels[i] = static_cast<std::ptrdiff_t>(k);
                changed = true;
            }
            clusters[k].add(samples[i], i);
        }

        bool structural = std::erase_if(clusters, [](const ClusterAccumulator &c)
                                        { return c.pixelCount == 0; }) > 0;
        structural |= mergeClose(clusters, false);
        structural |= dropNoise(clusters, samples.size());

        centroids = meansOf(clusters);

        if (structural)
        {
            // 中心编号已变化，下一轮全部重新标记
            std::ranges::fill(labels, -1);
        }
        else if (!changed)
        {
            spdlog::debug("[ColorExtractor] converged after {} iterations, K = {}", it + 1, centroids.size());
            break;
        }
    }
    return centroids;
}

std::vector<ClusterAccumulator> ColorExtractor::labelAll(const RasterImage &analysis, const RasterImage &reference, const std::vector<Centroid> &centroids) const
{
    std::vector<ClusterAccumulator> clusters(centroids.size());
    const std::uint8_t *data = analysis.data();
    const std::uint8_t *shown = reference.data();
    const size_t total = analysis.pixelCount();

    for (size_t i = 0; i < total; ++i)
    {
        const std::uint8_t *p = data + i * RasterImage::kChannels;
        const std::uint8_t *q = shown + i * RasterImage::kChannels;
        Centroid px{static_cast<double>(p[0]), static_cast<double>(p[1]), static_cast<double>(p[2])};
        Centroid original{static_cast<double>(q[0]), static_cast<double>(q[1]), static_cast<double>(q[2])};
        clusters[nearest(px, centroids)].add(px, original, i);
    }
    return clusters;
}

// ---------------------------------------------------------------
// Entry point
// ---------------------------------------------------------------
std::vector<ColorCluster> ColorExtractor::extract(const RasterImage &image) const
{
    return extract(image, image);
}

std::vector<ColorCluster> ColorExtractor::extract(const RasterImage &image, const RasterImage &reference) const
{
    if (image.isEmpty())
        throw PipelineError(ErrorKind::EmptyImage, "image has no pixels");
    if (reference.width() != image.width() || reference.height() != image.height())
        throw std::invalid_argument("reference image size does not match the analysis image");

    std::vector<Centroid> samples = samplePixels(image);
    std::vector<Centroid> centroids = refine(samples, seedFromHistogram(samples));

    // 最终对全部像素做一次标记，保证每个像素恰好属于一个簇；合并按报告颜色判断
    std::vector<ClusterAccumulator> clusters;
    while (true)
    {
        clusters = labelAll(image, reference, centroids);
        std::erase_if(clusters, [](const ClusterAccumulator &c)
                      { return c.pixelCount == 0; });
        mergeClose(clusters, true);
        if (!dropNoise(clusters, image.pixelCount()))
            break;
        centroids = meansOf(clusters);
    }

    std::ranges::sort(clusters, dominates);

    std::vector<ColorCluster> result;
    result.reserve(clusters.size());
    for (size_t i = 0; i < clusters.size(); ++i)
    {
        ColorCluster cluster;
        cluster.color = clusters[i].toColor();
        cluster.pixelCount = clusters[i].pixelCount;
        cluster.id = static_cast<int>(i);
        cluster.firstPixel = clusters[i].firstPixel;
        result.push_back(cluster);
    }

    spdlog::debug("[ColorExtractor] {} pixels -> {} clusters", image.pixelCount(), result.size());
    return result;
}
