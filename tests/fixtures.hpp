#pragma once
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>

// ---- Scaffolded sources ----

// context as left by the previous run, with one hand-written statement
static constexpr const char* OLD_CONTEXT = R"CS(using Microsoft.EntityFrameworkCore;

namespace Shop.Models;

public partial class ShopContext : DbContext
{
    public virtual DbSet<Customer> Customers { get; set; }

    protected override void OnModelCreating(ModelBuilder modelBuilder)
    {
        modelBuilder.Entity<Customer>(entity =>
        {
            entity.HasKey(e => e.Id).HasName("customers_pkey");

            entity.ToTable("customers");

            entity.Property(e => e.Name).HasMaxLength(100);
        });

        modelBuilder.HasDefaultSchema("shop");

        OnModelCreatingPartial(modelBuilder);
    }

    partial void OnModelCreatingPartial(ModelBuilder modelBuilder);
}
)CS";

// fresh scaffold: Customer changed, Order added, no custom code
static constexpr const char* NEW_CONTEXT = R"CS(using Microsoft.EntityFrameworkCore;

namespace Shop.Models;

public partial class ShopContext : DbContext
{
    public virtual DbSet<Customer> Customers { get; set; }

    public virtual DbSet<Order> Orders { get; set; }

    protected override void OnModelCreating(ModelBuilder modelBuilder)
    {
        modelBuilder.Entity<Customer>(entity =>
        {
            entity.HasKey(e => e.Id).HasName("customers_pkey");

            entity.ToTable("customers");

            entity.Property(e => e.Name).HasMaxLength(200);
        });

        modelBuilder.Entity<Order>(entity =>
        {
            entity.HasKey(e => e.Id).HasName("orders_pkey");

            entity.ToTable("orders");

            entity.HasOne(d => d.Customer).WithMany(p => p.Orders)
                .HasForeignKey(d => d.CustomerId)
                .HasConstraintName("orders_customer_id_fkey");
        });

        OnModelCreatingPartial(modelBuilder);
    }

    partial void OnModelCreatingPartial(ModelBuilder modelBuilder);
}
)CS";

static constexpr const char* OLD_CUSTOMER = R"CS(namespace Shop.Models;

public partial class Customer
{
    public int Id { get; set; }

    public string Name { get; set; } = null!;

    public string Email { get; set; } = null!;
}
)CS";

static constexpr const char* NEW_CUSTOMER = R"CS(namespace Shop.Models;

public partial class Customer
{
    public int Id { get; set; }

    public string? Name { get; set; }

    public DateTime CreatedAt { get; set; }

    public virtual ICollection<Order> Orders { get; set; } = new List<Order>();
}
)CS";

static constexpr const char* NEW_ORDER = R"CS(namespace Shop.Models;

public partial class Order
{
    public int Id { get; set; }

    public int CustomerId { get; set; }

    public decimal Total { get; set; }

    public virtual Customer Customer { get; set; } = null!;
}
)CS";

// ---- Filesystem helpers ----

class Random {
private:
    std::random_device rd;
    std::mt19937 gen;
public:
    Random() : gen(rd()) {}

    int get(int min, int max) {
        std::uniform_int_distribution<> distrib(min, max);
        return distrib(gen);
    }
};

// unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        Random rnd;
        path_ = std::filesystem::temp_directory_path() /
                ("ctxmerge_test_" + std::to_string(rnd.get(100000, 999999)));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::filesystem::path sub(const std::string& name) const {
        std::filesystem::path p = path_ / name;
        std::filesystem::create_directories(p);
        return p;
    }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void put_file(const std::filesystem::path& p, const std::string& text) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << text;
}

inline std::string get_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}
